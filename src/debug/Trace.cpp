//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/Trace.cpp
// Purpose: Implement deterministic tracing of debugger execution units.
// Key invariants: Each executed unit produces at most one flushed line and
//                 emission honours @ref TraceConfig::mode.
// Ownership/Lifetime: The sink emits to std::cerr and keeps loaded source files
//                     for the lifetime of the sink.
// Links: Session.cpp
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Implements unit tracing for debug sessions.
/// @details Two formats are supported.  Unit traces print the address and the
///          rendered opcode or block instruction; source traces print the
///          primary source location and echo the source text when the file
///          can be read.

#include "debug/Trace.hpp"

#include "debug/LocationMap.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <utility>

namespace strata::debug
{

bool TraceConfig::enabled() const
{
    return mode != Off;
}

TraceSink::TraceSink(TraceConfig cfg) : cfg(cfg) {}

/// @brief Retrieve cached file contents, loading from disk if necessary.
/// @details Files that cannot be opened are cached with no lines so repeated
///          trace entries do not retry the open.
/// @return Cached file entry or nullptr when no path is known.
const TraceSink::FileCacheEntry *TraceSink::getOrLoadFile(uint32_t file_id, std::string path)
{
    if (file_id == 0 || path.empty())
        return nullptr;
    auto it = fileCache.find(file_id);
    if (it != fileCache.end())
        return &it->second;

    FileCacheEntry entry;
    entry.path = std::move(path);
    std::ifstream f(entry.path);
    if (f)
    {
        std::string line;
        while (std::getline(f, line))
            entry.lines.push_back(line);
    }

    auto [pos, inserted] = fileCache.emplace(file_id, std::move(entry));
    (void)inserted;
    return &pos->second;
}

/// @brief Emit a trace line for a single executed unit.
/// @details Unit mode prints `[UNIT] addr=<a> op=<text>`.  Source mode prints
///          `[SRC] <file>:<line>:<col>  (addr=<a>)` followed by the source text
///          from the column onward when available, or `<unknown>` when the
///          address has no location.
void TraceSink::onStep(const OpcodeAddress &addr,
                       std::string_view text,
                       const LocationMap &locations)
{
    if (!cfg.enabled())
        return;
    if (cfg.mode == TraceConfig::Units)
    {
        std::cerr << "[UNIT] addr=" << addr << " op=" << text << '\n' << std::flush;
        return;
    }

    std::string locStr = "<unknown>";
    std::string srcLine;
    if (auto loc = locations.primaryLocation(addr); loc && loc->hasFile())
    {
        std::string path(locations.files().getPath(loc->file_id));
        locStr = path.empty() ? "#" + std::to_string(loc->file_id)
                              : std::filesystem::path(path).filename().string();
        if (loc->hasLine())
        {
            locStr += ':' + std::to_string(loc->line);
            if (loc->column != 0)
                locStr += ':' + std::to_string(loc->column);
        }
        const auto *entry = getOrLoadFile(loc->file_id, std::move(path));
        if (entry && loc->hasLine() && loc->line <= entry->lines.size())
        {
            const std::string &line = entry->lines[loc->line - 1];
            if (loc->column != 0 && loc->column - 1 < line.size())
                srcLine = line.substr(loc->column - 1);
            else
                srcLine = line;
            while (!srcLine.empty() && (srcLine.back() == '\n' || srcLine.back() == '\r'))
                srcLine.pop_back();
        }
    }
    std::cerr << "[SRC] " << locStr << "  (addr=" << addr << ')';
    if (!srcLine.empty())
        std::cerr << "  " << srcLine;
    std::cerr << '\n' << std::flush;
}

} // namespace strata::debug
