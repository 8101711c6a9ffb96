//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "debug/LocationMap.hpp"

namespace strata::debug
{
namespace
{
const std::vector<support::SourceLoc> kNoLocations;
} // namespace

LocationMap LocationMap::build(const DebugSymbols &symbols, const circuit::Program &program)
{
    LocationMap map;
    map.files_ = symbols.files;

    auto place = [&](const OpcodeAddress &addr) {
        auto it = symbols.locations.find(addr);
        map.table_.emplace(addr,
                           it == symbols.locations.end() ? std::vector<support::SourceLoc>{}
                                                         : it->second);
    };

    for (uint32_t i = 0; i < program.opcodes.size(); ++i)
    {
        place(OpcodeAddress::outerAt(i));
        if (const ucvm::Block *block = program.blockAt(i))
        {
            for (uint32_t j = 0; j < block->code.size(); ++j)
                place(OpcodeAddress::innerAt(i, j));
        }
    }
    return map;
}

bool LocationMap::contains(const OpcodeAddress &addr) const
{
    return table_.count(addr) != 0;
}

const std::vector<support::SourceLoc> &LocationMap::locationsFor(const OpcodeAddress &addr) const
{
    auto it = table_.find(addr);
    return it == table_.end() ? kNoLocations : it->second;
}

std::optional<support::SourceLoc> LocationMap::primaryLocation(const OpcodeAddress &addr) const
{
    const auto &locs = locationsFor(addr);
    if (locs.empty())
        return std::nullopt;
    return locs.front();
}

std::vector<OpcodeAddress> LocationMap::addressesAt(std::string_view file, uint32_t line) const
{
    std::vector<OpcodeAddress> out;
    const uint32_t fileId = files_.findFile(file);
    if (fileId == 0)
        return out;
    for (const auto &[addr, locs] : table_)
    {
        for (const auto &loc : locs)
        {
            if (loc.file_id == fileId && loc.line == line)
            {
                out.push_back(addr);
                break;
            }
        }
    }
    return out;
}

std::optional<OpcodeAddress> LocationMap::firstAddressAt(std::string_view file, uint32_t line) const
{
    auto all = addressesAt(file, line);
    if (all.empty())
        return std::nullopt;
    return all.front();
}

std::vector<OpcodeAddress> LocationMap::addresses() const
{
    std::vector<OpcodeAddress> out;
    out.reserve(table_.size());
    for (const auto &entry : table_)
        out.push_back(entry.first);
    return out;
}

std::string LocationMap::format(const support::SourceLoc &loc) const
{
    return support::formatLoc(loc, &files_);
}

} // namespace strata::debug
