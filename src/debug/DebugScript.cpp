//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/DebugScript.cpp
// Purpose: Implement the queue-based script loader that drives a debug session
//          without a front end.
// Links: Session.cpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Parses debugger command scripts into queued actions.
/// @details Recognised lines are "step", "step N", "over", "next", "continue"
///          and "restart".  Blank lines and lines starting with '#' are
///          skipped silently; anything else produces a `[DEBUG] ignored:`
///          message on stderr so scripts can be developed iteratively.

#include "debug/DebugScript.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>

namespace strata::debug
{

/// @brief Construct a script by loading actions from a command file.
/// @details Reads the file line-by-line through addLine().  A missing file
///          yields an empty script and a `[DEBUG]` message.
DebugScript::DebugScript(const std::string &path)
{
    std::ifstream f(path);
    if (!f)
    {
        std::cerr << "[DEBUG] unable to open " << path << "\n";
        return;
    }
    std::string line;
    while (std::getline(f, line))
        addLine(line);
}

bool DebugScript::addLine(std::string_view raw)
{
    auto isAsciiSpace = [](unsigned char ch) { return std::isspace(ch) != 0; };
    auto beginIt = std::find_if_not(raw.begin(), raw.end(), isAsciiSpace);
    auto endIt = std::find_if_not(raw.rbegin(), raw.rend(), isAsciiSpace).base();
    std::string line = beginIt >= endIt ? std::string() : std::string(beginIt, endIt);
    if (line.empty() || line.front() == '#')
        return true;

    if (line == "continue")
    {
        actions.push_back({DebugActionKind::Continue, 0});
    }
    else if (line == "step")
    {
        actions.push_back({DebugActionKind::Step, 1});
    }
    else if (line.rfind("step ", 0) == 0)
    {
        std::istringstream iss(line.substr(5));
        uint64_t n = 0;
        std::string rest;
        if (iss >> n && !(iss >> rest))
        {
            actions.push_back({DebugActionKind::Step, n});
        }
        else
        {
            std::cerr << "[DEBUG] ignored: " << line << "\n";
            return false;
        }
    }
    else if (line == "over")
    {
        actions.push_back({DebugActionKind::StepOver, 0});
    }
    else if (line == "next")
    {
        actions.push_back({DebugActionKind::Next, 0});
    }
    else if (line == "next over")
    {
        actions.push_back({DebugActionKind::NextOver, 0});
    }
    else if (line == "next out")
    {
        actions.push_back({DebugActionKind::NextOut, 0});
    }
    else if (line == "restart")
    {
        actions.push_back({DebugActionKind::Restart, 0});
    }
    else
    {
        std::cerr << "[DEBUG] ignored: " << line << "\n";
        return false;
    }
    return true;
}

/// @brief Queue a step action for @p count units.
/// @details Actions are enqueued in FIFO order so appended steps execute after
///          any previously loaded commands.
void DebugScript::addStep(uint64_t count)
{
    actions.push_back({DebugActionKind::Step, count});
}

void DebugScript::add(DebugActionKind kind)
{
    actions.push_back({kind, kind == DebugActionKind::Step ? 1u : 0u});
}

/// @brief Retrieve the next queued action.
/// @details Returns a Continue action when the queue is empty so the session
///          resumes execution naturally.
DebugAction DebugScript::nextAction()
{
    if (actions.empty())
        return {DebugActionKind::Continue, 0};
    auto act = actions.front();
    actions.pop_front();
    return act;
}

DebugAction DebugScript::peek() const
{
    if (actions.empty())
        return {DebugActionKind::Continue, 0};
    return actions.front();
}

} // namespace strata::debug
