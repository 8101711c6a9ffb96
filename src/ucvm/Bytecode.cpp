//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Textual rendering of unconstrained VM instructions.  The format is the one
// shown by opcode listings and trace lines, e.g. "r2 = fdiv r0, r1".
//
//===----------------------------------------------------------------------===//

#include "ucvm/Bytecode.hpp"

#include <sstream>
#include <type_traits>

namespace strata::ucvm
{
namespace
{
std::string reg(RegIndex r)
{
    return "r" + std::to_string(r);
}
} // namespace

std::string_view toString(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::Add:
            return "add";
        case BinaryOp::Sub:
            return "sub";
        case BinaryOp::Mul:
            return "mul";
        case BinaryOp::FieldDiv:
            return "fdiv";
        case BinaryOp::IntegerDiv:
            return "idiv";
        case BinaryOp::Equals:
            return "eq";
        case BinaryOp::LessThan:
            return "lt";
        case BinaryOp::LessThanEquals:
            return "le";
    }
    return "?";
}

/// @brief Render @p instr as a single line of assembly-like text.
std::string toString(const Instr &instr)
{
    std::ostringstream os;
    std::visit(
        [&os](const auto &in) {
            using T = std::decay_t<decltype(in)>;
            if constexpr (std::is_same_v<T, Const>)
                os << reg(in.dst) << " = const " << in.value;
            else if constexpr (std::is_same_v<T, Mov>)
                os << reg(in.dst) << " = mov " << reg(in.src);
            else if constexpr (std::is_same_v<T, Binary>)
                os << reg(in.dst) << " = " << toString(in.op) << ' ' << reg(in.lhs) << ", "
                   << reg(in.rhs);
            else if constexpr (std::is_same_v<T, Not>)
                os << reg(in.dst) << " = not " << reg(in.src);
            else if constexpr (std::is_same_v<T, Jump>)
                os << "jump @" << in.target;
            else if constexpr (std::is_same_v<T, JumpIf>)
                os << "jump_if " << reg(in.condition) << " @" << in.target;
            else if constexpr (std::is_same_v<T, JumpIfNot>)
                os << "jump_if_not " << reg(in.condition) << " @" << in.target;
            else if constexpr (std::is_same_v<T, Call>)
                os << "call @" << in.target;
            else if constexpr (std::is_same_v<T, Return>)
                os << "return";
            else if constexpr (std::is_same_v<T, Load>)
                os << reg(in.dst) << " = load [" << reg(in.address) << ']';
            else if constexpr (std::is_same_v<T, Store>)
                os << "store [" << reg(in.address) << "], " << reg(in.src);
            else if constexpr (std::is_same_v<T, CalldataCopy>)
                os << "calldata_copy m" << in.dst << ", offset=" << in.offset
                   << ", size=" << in.size;
            else if constexpr (std::is_same_v<T, Trap>)
                os << "trap \"" << in.message << '"';
            else if constexpr (std::is_same_v<T, Stop>)
                os << "stop m" << in.offset << ", size=" << in.size;
        },
        instr);
    return os.str();
}

} // namespace strata::ucvm
