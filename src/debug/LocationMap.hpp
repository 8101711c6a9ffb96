//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/LocationMap.hpp
// Purpose: Address to source location association for one program.
// Key invariants: The map is total over the program's addresses: every outer
//                 index and every inner index of every block invocation has an
//                 entry, possibly empty.  It is never modified after build().
// Ownership/Lifetime: Owns its tables and a copy of the file registry.
// Links: DebugSymbols.hpp, Session.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "circuit/Opcode.hpp"
#include "debug/DebugSymbols.hpp"
#include "debug/OpcodeAddress.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata::debug
{

/// @brief Read-only mapping between opcode addresses and source locations.
class LocationMap
{
  public:
    LocationMap() = default;

    /// @brief Build the map for @p program from @p symbols.
    /// @details Symbol entries for addresses the program does not contain are
    ///          dropped; program addresses without symbol entries map to the
    ///          empty list.
    static LocationMap build(const DebugSymbols &symbols, const circuit::Program &program);

    /// @brief Whether @p addr names an opcode or block instruction of the program.
    [[nodiscard]] bool contains(const OpcodeAddress &addr) const;

    /// @brief Source locations of @p addr in symbol-table order.
    [[nodiscard]] const std::vector<support::SourceLoc> &locationsFor(const OpcodeAddress &addr) const;

    /// @brief First location of @p addr, if any.
    [[nodiscard]] std::optional<support::SourceLoc> primaryLocation(const OpcodeAddress &addr) const;

    /// @brief Every address with a location at @p file:@p line, in execution order.
    /// @param file Full path or unambiguous basename.
    [[nodiscard]] std::vector<OpcodeAddress> addressesAt(std::string_view file, uint32_t line) const;

    /// @brief Lowest-ordered address at @p file:@p line.
    [[nodiscard]] std::optional<OpcodeAddress> firstAddressAt(std::string_view file,
                                                              uint32_t line) const;

    /// @brief All program addresses in order.
    [[nodiscard]] std::vector<OpcodeAddress> addresses() const;

    /// @brief File registry used to render locations.
    const support::SourceManager &files() const
    {
        return files_;
    }

    /// @brief Render @p loc as "path:line:col".
    [[nodiscard]] std::string format(const support::SourceLoc &loc) const;

  private:
    std::map<OpcodeAddress, std::vector<support::SourceLoc>> table_;
    support::SourceManager files_;
};

} // namespace strata::debug
