//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//

#include "circuit/Opcode.hpp"

#include <sstream>
#include <type_traits>

namespace strata::circuit
{

const ucvm::Block *Program::blockAt(size_t index) const
{
    if (index >= opcodes.size())
        return nullptr;
    const auto *call = std::get_if<BlockCall>(&opcodes[index]);
    if (!call || call->blockId >= blocks.size())
        return nullptr;
    return &blocks[call->blockId];
}

std::string toString(const Opcode &op, const Program &program)
{
    std::ostringstream os;
    std::visit(
        [&](const auto &o) {
            using T = std::decay_t<decltype(o)>;
            if constexpr (std::is_same_v<T, AssertZero>)
            {
                os << "assert " << toString(o.expr) << " = 0";
            }
            else
            {
                os << "call ";
                if (o.blockId < program.blocks.size() && !program.blocks[o.blockId].name.empty())
                    os << program.blocks[o.blockId].name;
                else
                    os << "block#" << o.blockId;
                os << " (";
                for (size_t i = 0; i < o.inputs.size(); ++i)
                    os << (i ? ", " : "") << toString(o.inputs[i]);
                os << ") -> [";
                for (size_t i = 0; i < o.outputs.size(); ++i)
                    os << (i ? ", " : "") << witnessName(o.outputs[i]);
                os << ']';
                if (o.predicate)
                    os << " if " << toString(*o.predicate);
            }
        },
        op);
    return os.str();
}

} // namespace strata::circuit
