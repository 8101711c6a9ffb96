//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the breakpoint registry consulted by the session controller
// before every execution unit.  Validation of addresses against the loaded
// program is the controller's job; the registry only stores what it is given.
//
//===----------------------------------------------------------------------===//

#include "debug/Breakpoints.hpp"

namespace strata::debug
{

/// @brief Register a breakpoint.
///
/// @details Insertion into the ordered set is idempotent, so re-adding an
///          existing breakpoint is harmless and reported through the return
///          value only.
///
/// @param addr Address before which execution pauses.
/// @return @c true when @p addr was newly registered.
bool Breakpoints::add(const OpcodeAddress &addr)
{
    return addrs_.insert(addr).second;
}

/// @brief Remove a breakpoint if present.
///
/// @param addr Address to unregister.
/// @return @c true when a breakpoint was erased.
bool Breakpoints::remove(const OpcodeAddress &addr)
{
    return addrs_.erase(addr) != 0;
}

/// @brief Check whether @p addr holds a breakpoint.
///
/// @details Lookup uses the full address.  A breakpoint on outer opcode 5 does
///          not fire while stepping through the block that opcode invokes.
bool Breakpoints::contains(const OpcodeAddress &addr) const
{
    return addrs_.count(addr) != 0;
}

/// @brief Snapshot the registered addresses in execution order.
std::vector<OpcodeAddress> Breakpoints::all() const
{
    return std::vector<OpcodeAddress>(addrs_.begin(), addrs_.end());
}

void Breakpoints::clear()
{
    addrs_.clear();
}

} // namespace strata::debug
