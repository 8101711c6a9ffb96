//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/circuit/Solver.hpp
// Purpose: Witness solving primitives for outer-tier opcodes and the
//          non-interactive reference solver built from them.
// Key invariants: The primitives never mutate the witness map they are handed
//                 except bindOutputs, which either writes every output or
//                 none.  solveProgram executes opcodes strictly in order.
// Ownership/Lifetime: Stateless free functions; callers own all maps.
// Links: Opcode.hpp, debug/SolveDriver.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "circuit/Opcode.hpp"
#include "support/expected.hpp"
#include "ucvm/Vm.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::circuit
{

/// @brief Failure classes reported while solving.
enum class SolveErrorKind : uint8_t
{
    UnsatisfiedConstraint, ///< Fully assigned gate is non-zero, or an output conflicts.
    MissingInput,          ///< Gate or block input depends on unassigned witnesses.
    BlockOutputMismatch,   ///< Block returned a different number of values than outputs.
    UnknownBlock,          ///< BlockCall names a block the program does not define.
    BlockFault             ///< The unconstrained VM faulted; see SolveError::fault.
};

constexpr std::string_view toString(SolveErrorKind kind) noexcept
{
    switch (kind)
    {
        case SolveErrorKind::UnsatisfiedConstraint:
            return "UnsatisfiedConstraint";
        case SolveErrorKind::MissingInput:
            return "MissingInput";
        case SolveErrorKind::BlockOutputMismatch:
            return "BlockOutputMismatch";
        case SolveErrorKind::UnknownBlock:
            return "UnknownBlock";
        case SolveErrorKind::BlockFault:
            return "BlockFault";
    }
    return "UnsatisfiedConstraint";
}

/// @brief Diagnostic produced by a failing solve step.
struct SolveError
{
    SolveErrorKind kind = SolveErrorKind::UnsatisfiedConstraint;
    std::string message;
    size_t opcodeIndex = 0;
    std::optional<ucvm::Fault> fault; ///< Populated for BlockFault.
};

/// @brief New witness assignment derived from a gate.
struct Binding
{
    WitnessId id{0};
    FieldElement value{};
};

/// @brief Result of solving one gate.
struct GateOutcome
{
    std::optional<Binding> binding; ///< Empty when the gate was already satisfied.
};

/// @brief Solve gate @p gate at @p index against @p witnesses.
/// @details Known witnesses are substituted first.  With no unknowns left the
///          gate must evaluate to zero; with exactly one unknown in linear
///          position its value is solved for.
/// @return The binding to add, or UnsatisfiedConstraint / MissingInput.
support::Expected<GateOutcome, SolveError>
solveGate(const AssertZero &gate, const WitnessMap &witnesses, size_t index);

/// @brief Evaluate the call data of @p call.
support::Expected<std::vector<FieldElement>, SolveError>
evaluateInputs(const BlockCall &call, const WitnessMap &witnesses, size_t index);

/// @brief Decide whether @p call executes.
/// @return False when the predicate is present and evaluates to zero.
support::Expected<bool, SolveError>
evaluatePredicate(const BlockCall &call, const WitnessMap &witnesses, size_t index);

/// @brief Write block results @p values into the outputs of @p call.
/// @details Fails without writing anything when the counts differ or when an
///          output already holds a different value.
support::Expected<void, SolveError> bindOutputs(const BlockCall &call,
                                                const std::vector<FieldElement> &values,
                                                WitnessMap &witnesses,
                                                size_t index);

/// @brief Solve every opcode of @p program in order starting from @p initial.
/// @return Final witness map, or the first error encountered.
support::Expected<WitnessMap, SolveError> solveProgram(const Program &program, WitnessMap initial);

} // namespace strata::circuit
