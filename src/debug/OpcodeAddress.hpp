//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/OpcodeAddress.hpp
// Purpose: Two-level execution position used by breakpoints, source maps and
//          the session controller.
// Key invariants: inner is engaged only while a block invoked by the opcode at
//                 outer is executing.  Ordering is by outer index, then an
//                 absent inner index before any present one, then by inner.
// Ownership/Lifetime: Value type.
// Links: LocationMap.hpp, Breakpoints.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace strata::debug
{

/// @brief Position within the outer opcode list and, optionally, a block.
struct OpcodeAddress
{
    uint32_t outer{0};
    std::optional<uint32_t> inner{};

    /// @brief Address of outer opcode @p index.
    static OpcodeAddress outerAt(uint32_t index)
    {
        return OpcodeAddress{index, std::nullopt};
    }

    /// @brief Address of instruction @p instr inside the block invoked by @p index.
    static OpcodeAddress innerAt(uint32_t index, uint32_t instr)
    {
        return OpcodeAddress{index, instr};
    }

    bool isInner() const
    {
        return inner.has_value();
    }

    /// @brief The enclosing outer opcode address.
    OpcodeAddress outerOnly() const
    {
        return outerAt(outer);
    }

    /// @brief Render as "<outer>" or "<outer>.<inner>".
    std::string toString() const;

    /// @brief Parse the textual form produced by toString().
    static std::optional<OpcodeAddress> parse(std::string_view text);

    bool operator==(const OpcodeAddress &rhs) const
    {
        return outer == rhs.outer && inner == rhs.inner;
    }

    bool operator!=(const OpcodeAddress &rhs) const
    {
        return !(*this == rhs);
    }

    bool operator<(const OpcodeAddress &rhs) const
    {
        if (outer != rhs.outer)
            return outer < rhs.outer;
        // std::optional orders nullopt before every value.
        return inner < rhs.inner;
    }
};

std::ostream &operator<<(std::ostream &os, const OpcodeAddress &addr);

} // namespace strata::debug
