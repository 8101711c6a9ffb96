//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/debug/Breakpoints.hpp
// Purpose: Registry of breakpoint addresses.
// Key invariants: Matching is exact: an outer address never matches an inner
//                 address of the same opcode and vice versa.  add/remove are
//                 idempotent.
// Ownership/Lifetime: Owns its address set; survives session restarts.
// Links: OpcodeAddress.hpp, Session.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "debug/OpcodeAddress.hpp"

#include <cstddef>
#include <set>
#include <vector>

namespace strata::debug
{

/// @brief Ordered set of breakpoint addresses.
class Breakpoints
{
  public:
    /// @brief Register @p addr.
    /// @return True when the breakpoint was not already present.
    bool add(const OpcodeAddress &addr);

    /// @brief Unregister @p addr.
    /// @return True when a breakpoint was removed.
    bool remove(const OpcodeAddress &addr);

    /// @brief Whether execution should pause before the unit at @p addr.
    [[nodiscard]] bool contains(const OpcodeAddress &addr) const;

    /// @brief Registered addresses in address order.
    [[nodiscard]] std::vector<OpcodeAddress> all() const;

    /// @brief Drop every breakpoint.
    void clear();

    [[nodiscard]] bool empty() const
    {
        return addrs_.empty();
    }

    [[nodiscard]] std::size_t size() const
    {
        return addrs_.size();
    }

  private:
    std::set<OpcodeAddress> addrs_; ///< Registered breakpoints
};

} // namespace strata::debug
