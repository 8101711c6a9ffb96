//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/circuit/Witness.hpp
// Purpose: Witness identifiers and the ordered witness assignment.
// Key invariants: A WitnessMap never holds two values for one id; iteration
//                 order is ascending id.
// Ownership/Lifetime: Plain value types.
// Links: Expression.hpp, Solver.hpp
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/field_element.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace strata::circuit
{

using support::FieldElement;

/// @brief Identifier of a circuit witness.
using WitnessId = uint32_t;

/// @brief Ordered assignment of witness ids to values.
using WitnessMap = std::map<WitnessId, FieldElement>;

/// @brief Display name of witness @p id, e.g. "_3".
inline std::string witnessName(WitnessId id)
{
    return "_" + std::to_string(id);
}

} // namespace strata::circuit
