//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/DebugScript.hpp
// Purpose: Parse debug command scripts for automated session control.
// Key invariants: Unknown commands are reported and skipped; actions are
//                 returned in FIFO order.
// Ownership/Lifetime: Holds parsed actions only; does not own external resources.
// Links: Session.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <string_view>

namespace strata::debug
{

/// @brief Supported debug action types.
enum class DebugActionKind
{
    Step,     ///< Execute a number of units
    StepOver, ///< Run the current block to completion
    Next,     ///< Run to the next source location
    NextOver, ///< Next without stopping inside calls
    NextOut,  ///< Next once the current frame has finished
    Continue, ///< Resume until a breakpoint or the end
    Restart   ///< Reset the solve
};

/// @brief Parsed action from a debug script.
struct DebugAction
{
    DebugActionKind kind; ///< Action kind
    uint64_t count;       ///< Unit count for stepping (unused otherwise)
};

/// @brief FIFO script of debug actions.
class DebugScript
{
  public:
    /// @brief Create an empty script.
    DebugScript() = default;

    /// @brief Load actions from script file @p path.
    explicit DebugScript(const std::string &path);

    /// @brief Parse one script line and queue the resulting action.
    /// @return False when the line was not recognised.
    bool addLine(std::string_view line);

    /// @brief Queue a step action for @p count units.
    void addStep(uint64_t count);

    /// @brief Queue an action of @p kind.
    void add(DebugActionKind kind);

    /// @brief Retrieve next action; defaults to Continue when empty.
    DebugAction nextAction();

    /// @brief Next action without removing it; Continue when empty.
    DebugAction peek() const;

    /// @brief Check if there are no pending actions.
    bool empty() const
    {
        return actions.empty();
    }

    std::size_t size() const
    {
        return actions.size();
    }

  private:
    std::deque<DebugAction> actions; ///< Pending actions
};

} // namespace strata::debug
