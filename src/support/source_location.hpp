//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares lightweight source location POD used by debug symbols.
// Key invariants: file_id == 0 denotes an invalid location; line/column are 1-based when valid.
// Ownership/Lifetime: Value type with no dynamic ownership.
// Links: support/source_manager.hpp, debug/LocationMap.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>

namespace strata::support
{

class SourceManager;

/// @brief Represents an absolute position within a source file.
/// @invariant file_id == 0 indicates an unknown location.
/// @ownership Value type with no owned resources.
struct SourceLoc
{
    /// @brief Identifier assigned by SourceManager; 0 denotes invalid location.
    uint32_t file_id = 0;

    /// @brief One-based line number within the file; 0 when unknown.
    uint32_t line = 0;

    /// @brief One-based column number within the line; 0 when unknown.
    uint32_t column = 0;

    /// @brief Check whether the location references a valid file entry.
    [[nodiscard]] bool isValid() const;

    /// @brief Determine whether a concrete file identifier is attached.
    [[nodiscard]] bool hasFile() const
    {
        return file_id != 0;
    }

    /// @brief Determine whether a 1-based line number is available.
    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }
};

/// @brief Locations are equal when file, line and column all match.
bool operator==(const SourceLoc &a, const SourceLoc &b);
bool operator!=(const SourceLoc &a, const SourceLoc &b);

/// @brief Render @p loc as "path:line:col", resolving the path through @p sm when given.
std::string formatLoc(const SourceLoc &loc, const SourceManager *sm = nullptr);

} // namespace strata::support
