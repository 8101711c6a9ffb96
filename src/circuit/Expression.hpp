//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/circuit/Expression.hpp
// Purpose: Degree-two arithmetic expressions over witnesses.
// Key invariants: An expression denotes
//                 sum(q_m * w_i * w_j) + sum(q_l * w_k) + q_c.
// Ownership/Lifetime: Plain value types owned by the enclosing opcode.
// Links: Opcode.hpp, Solver.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "circuit/Witness.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace strata::circuit
{

/// @brief Product term q * w_lhs * w_rhs.
struct MulTerm
{
    FieldElement coeff{};
    WitnessId lhs{0};
    WitnessId rhs{0};
};

/// @brief Linear term q * w.
struct LinearTerm
{
    FieldElement coeff{};
    WitnessId witness{0};
};

/// @brief Quadratic polynomial over witnesses.
struct Expression
{
    std::vector<MulTerm> mulTerms{};
    std::vector<LinearTerm> linearTerms{};
    FieldElement constant{};

    /// @brief Expression equal to the constant @p value.
    static Expression constantOf(FieldElement value);

    /// @brief Expression equal to witness @p id.
    static Expression witnessOf(WitnessId id);

    /// @brief True when the expression has no witness terms.
    bool isConstant() const
    {
        return mulTerms.empty() && linearTerms.empty();
    }
};

/// @brief Evaluate @p expr under @p witnesses.
/// @return Value, or std::nullopt when a referenced witness is unassigned.
std::optional<FieldElement> evaluate(const Expression &expr, const WitnessMap &witnesses);

/// @brief Collect the witnesses @p expr refers to.
std::set<WitnessId> referencedWitnesses(const Expression &expr);

/// @brief Render @p expr, e.g. "2*_1*_2 + _3 - 5".
std::string toString(const Expression &expr);

} // namespace strata::circuit
