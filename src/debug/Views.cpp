//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "debug/Views.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace strata::debug
{

std::vector<OpcodeRow> listOpcodes(const circuit::Program &program,
                                   const std::optional<OpcodeAddress> &current,
                                   const Breakpoints &breakpoints)
{
    std::vector<OpcodeRow> rows;
    auto push = [&](const OpcodeAddress &addr, std::string text) {
        rows.push_back(
            OpcodeRow{addr, std::move(text), current && *current == addr, breakpoints.contains(addr)});
    };

    for (uint32_t i = 0; i < program.opcodes.size(); ++i)
    {
        push(OpcodeAddress::outerAt(i), circuit::toString(program.opcodes[i], program));
        if (const ucvm::Block *block = program.blockAt(i))
        {
            for (uint32_t j = 0; j < block->code.size(); ++j)
                push(OpcodeAddress::innerAt(i, j), ucvm::toString(block->code[j]));
        }
    }
    return rows;
}

std::string formatListing(const std::vector<OpcodeRow> &rows)
{
    size_t width = 0;
    for (const auto &row : rows)
        width = std::max(width, row.address.toString().size());

    std::ostringstream os;
    for (const auto &row : rows)
    {
        os << (row.current ? "-> " : "   ");
        std::string addr = row.address.toString();
        if (row.address.isInner())
            os << "  ";
        os << std::left << std::setw(static_cast<int>(width)) << addr;
        os << (row.breakpoint ? " * " : "   ");
        os << row.text << '\n';
    }
    return os.str();
}

std::vector<VarsFrame> collectVars(const std::vector<VariableScope> &scopes,
                                   const OpcodeAddress &current,
                                   const circuit::WitnessMap &witnesses,
                                   const InnerVmAdapter &inner)
{
    std::vector<const VariableScope *> covering;
    for (const auto &scope : scopes)
    {
        if (scope.covers(current))
            covering.push_back(&scope);
    }
    // Outermost first: earlier start, then wider range.
    std::stable_sort(covering.begin(),
                     covering.end(),
                     [](const VariableScope *a, const VariableScope *b) {
                         if (a->first != b->first)
                             return a->first < b->first;
                         return b->last < a->last;
                     });

    std::vector<VarsFrame> frames;
    for (const VariableScope *scope : covering)
    {
        VarsFrame frame{scope->function, scope->params, {}};
        for (const auto &binding : scope->bindings)
        {
            if (binding.source == ValueSource::Witness)
            {
                auto it = witnesses.find(binding.index);
                if (it != witnesses.end())
                    frame.variables.push_back(VariableValue{binding.name, it->second});
            }
            else if (auto v = inner.readRegister(binding.index))
            {
                frame.variables.push_back(VariableValue{binding.name, v.value()});
            }
        }
        frames.push_back(std::move(frame));
    }
    return frames;
}

std::vector<StackFrame> collectStackTrace(const OpcodeAddress &current,
                                          const InnerVmAdapter &inner,
                                          const LocationMap &locations)
{
    std::vector<StackFrame> frames;
    auto push = [&](const OpcodeAddress &addr) {
        frames.push_back(StackFrame{addr, locations.locationsFor(addr)});
    };

    push(current.outerOnly());
    if (!current.isInner())
        return frames;

    if (auto stack = inner.callStack())
    {
        // Each return address follows the Call instruction that pushed it.
        for (uint32_t ret : stack.value())
        {
            if (ret > 0)
                push(OpcodeAddress::innerAt(current.outer, ret - 1));
        }
    }
    push(current);
    return frames;
}

} // namespace strata::debug
