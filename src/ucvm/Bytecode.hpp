//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/ucvm/Bytecode.hpp
// Purpose: Instruction set and block layout of the unconstrained VM.
// Key invariants: Register and memory operands are indices into fixed-size
//                 files declared by the owning Block; jump targets index the
//                 Block's code vector.  Neither is validated at construction:
//                 the VM reports violations as faults when executing.
// Ownership: Instructions and blocks are plain values.
// Lifetime: Blocks are owned by circuit::Program and outlive every VM run.
// Links: Vm.hpp, circuit/Opcode.hpp
//
//===----------------------------------------------------------------------===//
//
// The unconstrained VM is a register machine over BN254 field elements.  A
// block is entered with a list of call data values; the block copies them into
// memory with CalldataCopy, computes in registers, and hands results back to
// the caller through Stop, which names a memory range holding the outputs.

#pragma once

#include "support/field_element.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace strata::ucvm
{

using support::FieldElement;

/// @brief Index into a block's register file.
using RegIndex = uint32_t;

/// @brief Index into a block's memory.
using MemIndex = uint32_t;

/// @brief Maximum nesting of Call instructions before a StackOverflow fault.
constexpr uint32_t kMaxCallDepth = 1024;

/// @brief Binary operations over register operands.
/// @details Comparison operators compare the integer representatives and
///          produce 1 or 0.  FieldDiv multiplies by the inverse; IntegerDiv
///          truncates the integer quotient.
enum class BinaryOp : uint8_t
{
    Add,
    Sub,
    Mul,
    FieldDiv,
    IntegerDiv,
    Equals,
    LessThan,
    LessThanEquals
};

/// @brief Load an immediate into @c dst.
struct Const
{
    RegIndex dst{0};
    FieldElement value{};
};

/// @brief Copy register @c src into @c dst.
struct Mov
{
    RegIndex dst{0};
    RegIndex src{0};
};

/// @brief dst = lhs <op> rhs.
struct Binary
{
    BinaryOp op{BinaryOp::Add};
    RegIndex dst{0};
    RegIndex lhs{0};
    RegIndex rhs{0};
};

/// @brief Boolean negation: dst = 1 - src.
struct Not
{
    RegIndex dst{0};
    RegIndex src{0};
};

/// @brief Unconditional jump to instruction @c target.
struct Jump
{
    uint32_t target{0};
};

/// @brief Jump to @c target when register @c condition is non-zero.
struct JumpIf
{
    RegIndex condition{0};
    uint32_t target{0};
};

/// @brief Jump to @c target when register @c condition is zero.
struct JumpIfNot
{
    RegIndex condition{0};
    uint32_t target{0};
};

/// @brief Push the return address and jump to the nested routine at @c target.
struct Call
{
    uint32_t target{0};
};

/// @brief Return from the innermost nested call.
/// @details With an empty call stack the block finishes without return data.
struct Return
{
};

/// @brief dst = memory[registers[address]].
struct Load
{
    RegIndex dst{0};
    RegIndex address{0};
};

/// @brief memory[registers[address]] = registers[src].
struct Store
{
    RegIndex address{0};
    RegIndex src{0};
};

/// @brief memory[dst + i] = calldata[offset + i] for i in [0, size).
struct CalldataCopy
{
    MemIndex dst{0};
    uint32_t offset{0};
    uint32_t size{0};
};

/// @brief Abort the block with @c message.
struct Trap
{
    std::string message{};
};

/// @brief Finish the block returning memory[offset, offset + size).
struct Stop
{
    MemIndex offset{0};
    uint32_t size{0};
};

/// @brief Union over all instructions.
using Instr = std::variant<Const,
                           Mov,
                           Binary,
                           Not,
                           Jump,
                           JumpIf,
                           JumpIfNot,
                           Call,
                           Return,
                           Load,
                           Store,
                           CalldataCopy,
                           Trap,
                           Stop>;

/// @brief A self-contained unconstrained routine invoked from the outer tier.
struct Block
{
    std::string name{};           ///< Symbolic name for listings.
    uint32_t registerCount{0};    ///< Size of the register file.
    uint32_t memorySize{0};       ///< Number of addressable memory cells.
    std::vector<Instr> code{};    ///< Instructions, executed from index 0.
};

/// @brief Stable mnemonic for a binary operation.
std::string_view toString(BinaryOp op);

/// @brief Render an instruction for listings and trace output.
std::string toString(const Instr &instr);

} // namespace strata::ucvm
