//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "debug/OpcodeAddress.hpp"

#include <charconv>
#include <system_error>

namespace strata::debug
{
namespace
{
std::optional<uint32_t> parseIndex(std::string_view text)
{
    if (text.empty())
        return std::nullopt;
    uint32_t value = 0;
    const char *end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end)
        return std::nullopt;
    return value;
}
} // namespace

std::string OpcodeAddress::toString() const
{
    std::string text = std::to_string(outer);
    if (inner)
        text += "." + std::to_string(*inner);
    return text;
}

std::optional<OpcodeAddress> OpcodeAddress::parse(std::string_view text)
{
    const auto dot = text.find('.');
    auto outer = parseIndex(text.substr(0, dot));
    if (!outer)
        return std::nullopt;
    if (dot == std::string_view::npos)
        return outerAt(*outer);
    auto inner = parseIndex(text.substr(dot + 1));
    if (!inner)
        return std::nullopt;
    return innerAt(*outer, *inner);
}

std::ostream &operator<<(std::ostream &os, const OpcodeAddress &addr)
{
    return os << addr.toString();
}

} // namespace strata::debug
