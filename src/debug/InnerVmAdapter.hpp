//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/InnerVmAdapter.hpp
// Purpose: Step, inspect and mutate one active unconstrained block invocation.
// Key invariants: At most one block is active.  Registers never written by
//                 the block or the user read as NotYetAvailable.  Before the
//                 first stepOne() after enter(), memory reads report
//                 NotYetAvailable except for cells the user wrote.  A failing
//                 stepOne() leaves the VM state untouched.
// Ownership/Lifetime: Owns the ucvm::Vm of the active block; the Block itself
//                     is borrowed from the program, which outlives the adapter.
// Links: ucvm/Vm.hpp, SolveDriver.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "debug/DebugError.hpp"
#include "debug/OpcodeAddress.hpp"
#include "ucvm/Vm.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace strata::debug
{

using support::FieldElement;

/// @brief Outcome of one inner step.
enum class InnerStepKind
{
    Continuing,       ///< Instruction executed; block still active.
    BlockReturned,    ///< Block finished; outputs carry its results.
    CalledNestedBlock ///< A nested call pushed a frame; still inside the block.
};

struct InnerStep
{
    InnerStepKind kind = InnerStepKind::Continuing;
    std::vector<FieldElement> outputs; ///< Populated for BlockReturned.
};

/// @brief Adapter exposing the debugger protocol over a ucvm::Vm.
class InnerVmAdapter
{
  public:
    InnerVmAdapter() = default;

    /// @brief Deep-copy the active block state, used to checkpoint a step.
    InnerVmAdapter(const InnerVmAdapter &other);
    InnerVmAdapter &operator=(const InnerVmAdapter &other);
    InnerVmAdapter(InnerVmAdapter &&) noexcept = default;
    InnerVmAdapter &operator=(InnerVmAdapter &&) noexcept = default;

    /// @brief Begin executing @p block for outer opcode @p outerIndex.
    /// @details @p inputs become the block's call data; pc starts at 0.
    void enter(const ucvm::Block &block, std::vector<FieldElement> inputs, uint32_t outerIndex);

    /// @brief Discard the active block, if any.
    void reset();

    [[nodiscard]] bool active() const
    {
        return vm_ != nullptr;
    }

    /// @brief Execute exactly the instruction at the program counter.
    Expected<InnerStep> stepOne();

    /// @brief Whether the next stepOne() can finish the block.
    [[nodiscard]] bool mayFinish() const;

    /// @brief Current position as an inner address.
    [[nodiscard]] std::optional<OpcodeAddress> address() const;

    /// @brief Program counter of the active block.
    [[nodiscard]] Expected<uint32_t> pc() const;

    [[nodiscard]] Expected<FieldElement> readRegister(ucvm::RegIndex index) const;
    Expected<void> writeRegister(ucvm::RegIndex index, FieldElement value);
    [[nodiscard]] Expected<FieldElement> readMemory(ucvm::MemIndex index) const;
    Expected<void> writeMemory(ucvm::MemIndex index, FieldElement value);

    /// @brief Register file; std::nullopt marks registers not yet available.
    [[nodiscard]] Expected<std::vector<std::optional<FieldElement>>> registers() const;

    /// @brief Memory cells of the active block; NotYetAvailable before the
    ///        first step.
    [[nodiscard]] Expected<std::vector<FieldElement>> memory() const;

    /// @brief Return addresses of active nested calls, outermost first.
    [[nodiscard]] Expected<std::vector<uint32_t>> callStack() const;

    /// @brief Block being executed, or nullptr.
    [[nodiscard]] const ucvm::Block *block() const
    {
        return vm_ ? &vm_->block() : nullptr;
    }

  private:
    DebugError notActive() const;
    DebugError notYetAvailable(const std::string &what) const;

    std::unique_ptr<ucvm::Vm> vm_;
    uint32_t outer_ = 0;
    bool stepped_ = false; ///< True once stepOne() succeeded for this block.
    std::set<ucvm::MemIndex> earlyWrites_; ///< Cells written before the first step.
};

} // namespace strata::debug
