//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/Views.hpp
// Purpose: Derived read-only views of a paused session: opcode listing,
//          variables in scope and the stack trace.
// Key invariants: Views never fail and never mutate session state; values
//                 that are unavailable at the current pause point are omitted.
// Ownership/Lifetime: Results are plain values owned by the caller.
// Links: Session.hpp, DebugSymbols.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "circuit/Opcode.hpp"
#include "debug/Breakpoints.hpp"
#include "debug/DebugSymbols.hpp"
#include "debug/InnerVmAdapter.hpp"
#include "debug/LocationMap.hpp"
#include "debug/OpcodeAddress.hpp"

#include <optional>
#include <string>
#include <vector>

namespace strata::debug
{

/// @brief One line of the opcode listing.
struct OpcodeRow
{
    OpcodeAddress address{};
    std::string text{};
    bool current{false};    ///< Execution is paused before this row.
    bool breakpoint{false}; ///< A breakpoint is registered here.
};

/// @brief A variable and its current value.
struct VariableValue
{
    std::string name{};
    FieldElement value{};
};

/// @brief Variables of one scope covering the current address.
struct VarsFrame
{
    std::string function{};
    std::vector<std::string> params{};
    std::vector<VariableValue> variables{};
};

/// @brief One entry of the stack trace.
struct StackFrame
{
    OpcodeAddress address{};
    std::vector<support::SourceLoc> locations{};
};

/// @brief List every outer opcode and, below each block invocation, the block's
///        instructions.
/// @param current Pause position, or std::nullopt when not paused in the program.
std::vector<OpcodeRow> listOpcodes(const circuit::Program &program,
                                   const std::optional<OpcodeAddress> &current,
                                   const Breakpoints &breakpoints);

/// @brief Render @p rows one per line; "->" marks the current row and "*"
///        marks breakpoints, e.g. "->   1.2 * r2 = fdiv r0, r1".
std::string formatListing(const std::vector<OpcodeRow> &rows);

/// @brief Variables visible at @p current, outermost scope first.
std::vector<VarsFrame> collectVars(const std::vector<VariableScope> &scopes,
                                   const OpcodeAddress &current,
                                   const circuit::WitnessMap &witnesses,
                                   const InnerVmAdapter &inner);

/// @brief Frames from the outer opcode down to the current inner position.
std::vector<StackFrame> collectStackTrace(const OpcodeAddress &current,
                                          const InnerVmAdapter &inner,
                                          const LocationMap &locations);

} // namespace strata::debug
