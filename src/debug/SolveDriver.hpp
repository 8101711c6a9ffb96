//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/SolveDriver.hpp
// Purpose: Pausable outer solver: owns the witness map and advances the
//          program one execution unit at a time.
// Key invariants: Executing every unit from a restart yields the same witness
//                 map as circuit::solveProgram.  A failing unit leaves the
//                 witness map, position and inner state exactly as before.
// Ownership/Lifetime: Borrows the Program (which must outlive the driver);
//                     owns the witness map, the initial assignment and the
//                     inner VM adapter.
// Links: circuit/Solver.hpp, InnerVmAdapter.hpp, Session.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "circuit/Opcode.hpp"
#include "circuit/Solver.hpp"
#include "debug/DebugError.hpp"
#include "debug/InnerVmAdapter.hpp"
#include "debug/OpcodeAddress.hpp"

#include <cstdint>
#include <functional>
#include <optional>

namespace strata::debug
{

/// @brief Kind of execution unit performed by SolveDriver::stepOne().
enum class UnitKind
{
    Gate,        ///< Solved one gate opcode.
    EnterBlock,  ///< Entered the block of a block-invocation opcode.
    SkipBlock,   ///< Predicate was zero; outputs bound to zero without entering.
    Inner,       ///< Executed one block instruction.
    ReturnBlock  ///< Executed the final block instruction and bound its outputs.
};

/// @brief Description of an executed unit.
struct UnitResult
{
    UnitKind kind = UnitKind::Gate;
    OpcodeAddress executed{}; ///< Address the unit started at.
};

/// @brief Callback invoked after each unit a multi-unit command executes.
using UnitObserver = std::function<void(const UnitResult &)>;

/// @brief Drives a program forward over a mutable witness map.
class SolveDriver
{
  public:
    SolveDriver(const circuit::Program &program, circuit::WitnessMap initial);

    /// @brief Address of the next unit to execute.
    [[nodiscard]] OpcodeAddress address() const;

    /// @brief True once every outer opcode has been executed.
    [[nodiscard]] bool finished() const
    {
        return outer_ >= program_.opcodes.size();
    }

    /// @brief Execute exactly one unit.
    Expected<UnitResult> stepOne();

    /// @brief Run the block at or about to be entered at the current opcode to
    ///        completion.  At a gate opcode this executes that gate only.
    /// @param onUnit Notified of every unit that completed, when set.
    Expected<void> stepOverBlock(const UnitObserver &onUnit = {});

    /// @brief Discard all solver state and rebuild it from the initial assignment.
    void restart();

    [[nodiscard]] Expected<FieldElement> readWitness(circuit::WitnessId id) const;

    /// @brief Override witness @p id with @p value.
    /// @return Previous value, if the witness was bound.
    std::optional<FieldElement> writeWitness(circuit::WitnessId id, FieldElement value);

    [[nodiscard]] const circuit::WitnessMap &witnesses() const
    {
        return witnesses_;
    }

    [[nodiscard]] const InnerVmAdapter &inner() const
    {
        return inner_;
    }

    InnerVmAdapter &inner()
    {
        return inner_;
    }

    [[nodiscard]] const circuit::Program &program() const
    {
        return program_;
    }

    /// @brief Units executed since the last restart.
    [[nodiscard]] uint64_t unitsExecuted() const
    {
        return units_;
    }

    /// @brief Fail with StepLimitExceeded once @p limit units ran; 0 disables.
    void setStepLimit(uint64_t limit)
    {
        stepLimit_ = limit;
    }

  private:
    Expected<UnitResult> stepOuter();
    Expected<UnitResult> stepInner();
    void advanceOuter();

    const circuit::Program &program_;
    circuit::WitnessMap initial_;
    circuit::WitnessMap witnesses_;
    InnerVmAdapter inner_;
    uint32_t outer_ = 0;
    uint64_t units_ = 0;
    uint64_t stepLimit_ = 0;
};

} // namespace strata::debug
