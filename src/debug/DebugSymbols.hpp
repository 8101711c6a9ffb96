//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/DebugSymbols.hpp
// Purpose: Compiler-provided debug information consumed by a session.
// Key invariants: Location lists keep the order the compiler emitted them in.
//                 A scope covers the inclusive address range [first, last].
// Ownership/Lifetime: Plain aggregate; the session keeps its own copy.
// Links: LocationMap.hpp, Views.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "debug/OpcodeAddress.hpp"
#include "support/source_location.hpp"
#include "support/source_manager.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace strata::debug
{

/// @brief Where a source variable lives at run time.
enum class ValueSource : uint8_t
{
    Witness, ///< Outer witness id.
    Register ///< Register of the active block.
};

/// @brief Association of a source variable with a storage slot.
struct VariableBinding
{
    std::string name{};
    ValueSource source{ValueSource::Witness};
    uint32_t index{0}; ///< Witness id or register index, per @c source.
};

/// @brief Lexical scope of one source function.
struct VariableScope
{
    std::string function{};
    std::vector<std::string> params{};
    OpcodeAddress first{};
    OpcodeAddress last{};
    std::vector<VariableBinding> bindings{};

    /// @brief True when @p addr lies in [first, last].
    bool covers(const OpcodeAddress &addr) const
    {
        return !(addr < first) && !(last < addr);
    }
};

/// @brief Debug information emitted alongside a compiled program.
struct DebugSymbols
{
    support::SourceManager files{};
    std::map<OpcodeAddress, std::vector<support::SourceLoc>> locations{};
    std::vector<VariableScope> scopes{};
};

} // namespace strata::debug
