//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: include/strata/debug/Session.hpp
// Purpose: Declare the interactive debug session for two-tier circuit programs
//          without exposing solver or VM internals.
// Invariants: Only the session transitions SessionState.  A fatal error moves
//             the session to Failed and leaves the witness map and block state
//             as they were before the failing unit; non-fatal errors change
//             nothing.  Running to Finished yields the same witness map as
//             circuit::solveProgram on the same inputs.
// Ownership: Session owns its copy of the program, the debug symbols and the
//            initial assignment; scripts are borrowed for one runScript call.
// Links: src/debug/SolveDriver.hpp, src/debug/Breakpoints.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "circuit/Opcode.hpp"
#include "circuit/Witness.hpp"
#include "debug/DebugError.hpp"
#include "debug/DebugScript.hpp"
#include "debug/DebugSymbols.hpp"
#include "debug/OpcodeAddress.hpp"
#include "debug/Trace.hpp"
#include "debug/Views.hpp"
#include "support/field_element.hpp"
#include "support/source_location.hpp"
#include "ucvm/Bytecode.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::debug
{

class LocationMap;

/// @brief Lifecycle of a debug session.
enum class SessionState
{
    NotStarted,         ///< Constructed or restarted; nothing executed.
    Running,            ///< A command is executing units.
    PausedAtBreakpoint, ///< Stopped before a unit carrying a breakpoint.
    PausedAfterStep,    ///< Stopped after a step, next or block step-over.
    Finished,           ///< Every opcode executed; final witness map available.
    Failed              ///< A fatal error ended the solve; see lastError().
};

constexpr std::string_view toString(SessionState state) noexcept
{
    switch (state)
    {
        case SessionState::NotStarted:
            return "NotStarted";
        case SessionState::Running:
            return "Running";
        case SessionState::PausedAtBreakpoint:
            return "PausedAtBreakpoint";
        case SessionState::PausedAfterStep:
            return "PausedAfterStep";
        case SessionState::Finished:
            return "Finished";
        case SessionState::Failed:
            return "Failed";
    }
    return "Failed";
}

/// @brief Configuration parameters for a debug session.
struct SessionConfig
{
    TraceConfig trace;       ///< Tracing configuration.
    uint64_t maxSteps = 0;   ///< Unit limit per solve; zero defers to STRATA_MAX_STEPS.
    bool stopOnEntry = true; ///< Pause before the first unit when starting.
};

/// @brief Interactive debugger over one program instance.
class Session
{
  public:
    /// @brief Create a session solving @p program from @p initial.
    Session(circuit::Program program,
            DebugSymbols symbols,
            circuit::WitnessMap initial,
            SessionConfig config = {});

    ~Session();

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;
    Session(Session &&) noexcept;
    Session &operator=(Session &&) noexcept;

    [[nodiscard]] SessionState state() const;

    //===------------------------------------------------------------------===//
    // Execution control
    //===------------------------------------------------------------------===//

    /// @brief Begin solving; pauses at the first opcode unless configured not to.
    Expected<SessionState> start();

    /// @brief Execute exactly one unit.
    Expected<SessionState> step();

    /// @brief Run the current (or about to be entered) block to completion.
    Expected<SessionState> stepOverBlock();

    /// @brief Run until the primary source location changes, a breakpoint is
    ///        reached or the program ends.
    Expected<SessionState> next();

    /// @brief Like next(), but runs calls made from the current frame to
    ///        completion without stopping inside them.
    Expected<SessionState> nextOver();

    /// @brief Run until the current frame finishes and the primary source
    ///        location changes, or a breakpoint is reached.
    /// @details At the outer tier there is no enclosing frame, so this runs to
    ///          the next breakpoint or the end of the program.
    Expected<SessionState> nextOut();

    /// @brief Run until a breakpoint is reached or the program ends.
    Expected<SessionState> cont();

    /// @brief Reset the solve to the initial assignment and start again.
    /// @details Breakpoints survive the restart.
    Expected<SessionState> restart();

    /// @brief Replay @p script, starting the session first when needed.
    /// @details Stops early when the session finishes or fails and the next
    ///          action is not a restart.
    Expected<SessionState> runScript(DebugScript &script);

    //===------------------------------------------------------------------===//
    // Breakpoints
    //===------------------------------------------------------------------===//

    /// @return True when the breakpoint was newly added.
    Expected<bool> addBreakpoint(const OpcodeAddress &addr);

    /// @return True when a breakpoint was removed.
    Expected<bool> removeBreakpoint(const OpcodeAddress &addr);

    /// @brief Break at the first address mapped to @p file:@p line.
    Expected<OpcodeAddress> addBreakpointAtLine(std::string_view file, uint32_t line);

    [[nodiscard]] std::vector<OpcodeAddress> breakpoints() const;

    void clearBreakpoints();

    //===------------------------------------------------------------------===//
    // State inspection and mutation
    //===------------------------------------------------------------------===//

    [[nodiscard]] Expected<support::FieldElement> readWitness(circuit::WitnessId id) const;

    /// @brief Override a witness for all later evaluations.
    /// @return Previous value, if the witness was bound.
    Expected<std::optional<support::FieldElement>> writeWitness(circuit::WitnessId id,
                                                                support::FieldElement value);

    [[nodiscard]] const circuit::WitnessMap &witnessMap() const;

    [[nodiscard]] Expected<support::FieldElement> readRegister(ucvm::RegIndex index) const;
    Expected<void> writeRegister(ucvm::RegIndex index, support::FieldElement value);
    [[nodiscard]] Expected<support::FieldElement> readMemory(ucvm::MemIndex index) const;
    Expected<void> writeMemory(ucvm::MemIndex index, support::FieldElement value);
    [[nodiscard]] Expected<std::vector<std::optional<support::FieldElement>>> registers() const;
    [[nodiscard]] Expected<std::vector<support::FieldElement>> memory() const;

    //===------------------------------------------------------------------===//
    // Derived views
    //===------------------------------------------------------------------===//

    [[nodiscard]] std::vector<OpcodeRow> listOpcodes() const;
    [[nodiscard]] std::vector<VarsFrame> vars() const;
    [[nodiscard]] std::vector<StackFrame> stacktrace() const;

    /// @brief Address of the next unit, or std::nullopt when not started or finished.
    [[nodiscard]] std::optional<OpcodeAddress> currentAddress() const;

    /// @brief Source locations mapped to @p addr.
    [[nodiscard]] const std::vector<support::SourceLoc> &sourceLocations(const OpcodeAddress &addr) const;

    /// @brief Render @p loc using the session's file table.
    [[nodiscard]] std::string formatLocation(const support::SourceLoc &loc) const;

    [[nodiscard]] const LocationMap &locationMap() const;

    [[nodiscard]] const circuit::Program &program() const;

    /// @brief Final witness map; InvalidCommandForState unless Finished.
    [[nodiscard]] Expected<circuit::WitnessMap> finalWitness() const;

    /// @brief Error that moved the session to Failed, if any.
    [[nodiscard]] const std::optional<DebugError> &lastError() const;

    /// @brief Units executed since the last (re)start.
    [[nodiscard]] uint64_t unitsExecuted() const;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace strata::debug
