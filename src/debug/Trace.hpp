//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/Trace.hpp
// Purpose: Declare tracing configuration and sink for executed debugger units.
// Key invariants: Trace output is deterministic and line-oriented; at most one
//                 line is emitted per executed unit.
// Ownership/Lifetime: Sink holds configuration by value and caches source file
//                     contents it has echoed.
// Links: Session.hpp, LocationMap.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "debug/OpcodeAddress.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace strata::debug
{

class LocationMap;

/// @brief Configuration for unit tracing.
struct TraceConfig
{
    /// @brief Tracing modes.
    enum Mode
    {
        Off,   ///< Tracing disabled
        Units, ///< Trace opcodes and block instructions
        Source ///< Trace source locations
    } mode{Off};

    /// @brief Check whether tracing is enabled.
    bool enabled() const;
};

/// @brief Sink that formats and emits trace lines to stderr.
class TraceSink
{
  public:
    /// @brief Create sink with configuration @p cfg.
    explicit TraceSink(TraceConfig cfg = {});

    /// @brief Record execution of the unit at @p addr rendered as @p text.
    void onStep(const OpcodeAddress &addr, std::string_view text, const LocationMap &locations);

  private:
    /// @brief Cache entry describing a traced source file.
    struct FileCacheEntry
    {
        std::string path;               ///< Canonical file path.
        std::vector<std::string> lines; ///< File contents split into lines.
    };

    /// @brief Retrieve cached file for @p file_id, loading it on first access.
    const FileCacheEntry *getOrLoadFile(uint32_t file_id, std::string path);

    TraceConfig cfg;                                        ///< Active configuration.
    std::unordered_map<uint32_t, FileCacheEntry> fileCache; ///< Loaded source files.
};

} // namespace strata::debug
