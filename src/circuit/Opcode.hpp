//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/circuit/Opcode.hpp
// Purpose: Outer-tier opcodes and the compiled program consumed by the solver
//          and the debugger.
// Key invariants: BlockCall::blockId indexes Program::blocks.  A program is
//                 immutable once handed to a solver or a debug session.
// Ownership/Lifetime: Program owns its opcodes and blocks by value.
// Links: Solver.hpp, ucvm/Bytecode.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "circuit/Expression.hpp"
#include "ucvm/Bytecode.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace strata::circuit
{

/// @brief Gate constraint: expr == 0.
struct AssertZero
{
    Expression expr{};
};

/// @brief Invoke an unconstrained block and bind its results to witnesses.
/// @details Inputs are evaluated in order and become the block's call data.
///          When @c predicate is present and evaluates to zero the block is
///          skipped and every output is bound to zero.
struct BlockCall
{
    uint32_t blockId{0};
    std::vector<Expression> inputs{};
    std::vector<WitnessId> outputs{};
    std::optional<Expression> predicate{};
};

/// @brief Outer-tier opcode.
using Opcode = std::variant<AssertZero, BlockCall>;

/// @brief Compiled circuit: an ordered opcode list plus the blocks it invokes.
struct Program
{
    std::vector<Opcode> opcodes{};
    std::vector<ucvm::Block> blocks{};

    /// @brief Block invoked by opcode @p index, or nullptr for gate opcodes and
    ///        out-of-range indices.
    const ucvm::Block *blockAt(size_t index) const;
};

/// @brief Render @p op for listings, resolving block names through @p program.
std::string toString(const Opcode &op, const Program &program);

} // namespace strata::circuit
