//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ucvm/Vm.hpp
// Purpose: Register/memory interpreter for one invocation of an unconstrained block.
// Key invariants: step() executes at most one instruction and either applies all
//                 of its effects or none of them.  Register and memory files
//                 have exactly the sizes declared by the block.  Call depth
//                 never exceeds kMaxCallDepth.
// Ownership: VM borrows the Block (non-owning reference) and owns its register
//            file, memory, call data and call stack.
// Lifetime: One VM per block invocation; discarded once the block finishes.
// Links: Bytecode.hpp, debug/InnerVmAdapter.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/expected.hpp"
#include "ucvm/Bytecode.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::ucvm
{

/// @brief Fault kinds raised while executing a block.
enum class FaultKind : uint8_t
{
    InvalidRegisterIndex, ///< Operand names a register outside the register file.
    InvalidMemoryIndex,   ///< Address or range outside block memory or call data.
    OutOfBoundsJump,      ///< Jump or call target outside the block's code.
    DivisionByZero,       ///< Field or integer division by zero.
    Trap,                 ///< Explicit Trap instruction.
    StackOverflow         ///< Call depth exceeded kMaxCallDepth.
};

/// @brief Convert a fault kind to its canonical name.
constexpr std::string_view toString(FaultKind kind) noexcept
{
    switch (kind)
    {
        case FaultKind::InvalidRegisterIndex:
            return "InvalidRegisterIndex";
        case FaultKind::InvalidMemoryIndex:
            return "InvalidMemoryIndex";
        case FaultKind::OutOfBoundsJump:
            return "OutOfBoundsJump";
        case FaultKind::DivisionByZero:
            return "DivisionByZero";
        case FaultKind::Trap:
            return "Trap";
        case FaultKind::StackOverflow:
            return "StackOverflow";
    }
    return "Trap";
}

/// @brief Fault record returned by a failing step.
struct Fault
{
    FaultKind kind = FaultKind::Trap; ///< Fault classification.
    std::string message;              ///< Human-readable description.
    uint32_t pc = 0;                  ///< Instruction that faulted.
};

/// @brief Outcome of a successful step.
enum class StepStatus
{
    Continuing, ///< Instruction executed; more remain.
    Called,     ///< A nested Call pushed a new frame.
    Finished    ///< The block finished; returnData holds its outputs.
};

/// @brief Payload returned by step().
struct StepResult
{
    StepStatus status = StepStatus::Continuing;
    std::vector<FieldElement> returnData; ///< Populated when status is Finished.
};

/// @brief Interpreter for a single unconstrained block invocation.
class Vm
{
  public:
    /// @brief Prepare a run of @p block with @p calldata as its inputs.
    /// @details Registers start unwritten, memory starts zeroed, pc is 0.
    Vm(const Block &block, std::vector<FieldElement> calldata);

    /// @brief Execute the instruction at the current program counter.
    /// @return Step outcome, or the fault that prevented execution.  A faulting
    ///         step leaves every register, memory cell and the pc unchanged.
    support::Expected<StepResult, Fault> step();

    /// @brief Run until the block finishes or faults.
    support::Expected<std::vector<FieldElement>, Fault> run();

    /// @brief Index of the next instruction to execute.
    uint32_t pc() const
    {
        return pc_;
    }

    /// @brief Return addresses of active nested calls, outermost first.
    const std::vector<uint32_t> &callStack() const
    {
        return callStack_;
    }

    /// @brief True once a step reported StepStatus::Finished.
    bool finished() const
    {
        return finished_;
    }

    /// @brief Register file; std::nullopt marks registers never written.
    const std::vector<std::optional<FieldElement>> &registers() const
    {
        return registers_;
    }

    const std::vector<FieldElement> &memory() const
    {
        return memory_;
    }

    const std::vector<FieldElement> &calldata() const
    {
        return calldata_;
    }

    const Block &block() const
    {
        return block_;
    }

    /// @brief Instructions executed since construction.
    uint64_t instrCount() const
    {
        return instrCount_;
    }

    /// @brief Overwrite register @p index; returns false when out of range.
    bool setRegister(RegIndex index, FieldElement value);

    /// @brief Overwrite memory cell @p index; returns false when out of range.
    bool setMemory(MemIndex index, FieldElement value);

  private:
    /// @brief Pending register write computed before commit.
    struct RegWrite
    {
        RegIndex index;
        FieldElement value;
    };

    support::Expected<FieldElement, Fault> readReg(RegIndex index) const;
    support::Expected<MemIndex, Fault> addressIn(RegIndex index) const;
    std::optional<Fault> checkRegister(RegIndex index) const;
    std::optional<Fault> checkTarget(uint32_t target) const;
    std::optional<Fault> checkMemoryRange(uint64_t begin, uint64_t size) const;
    support::Expected<FieldElement, Fault> evalBinary(const Binary &in) const;
    Fault fault(FaultKind kind, std::string message) const;

    /// @brief Advance past the current instruction, finishing at end of code.
    StepResult advanceTo(uint32_t next);

    const Block &block_;
    std::vector<FieldElement> calldata_;
    std::vector<std::optional<FieldElement>> registers_;
    std::vector<FieldElement> memory_;
    std::vector<uint32_t> callStack_;
    uint32_t pc_ = 0;
    bool finished_ = false;
    uint64_t instrCount_ = 0;
};

} // namespace strata::ucvm
