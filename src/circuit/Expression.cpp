//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Evaluation and rendering of witness expressions.  Coefficients whose
// negation is a smaller integer are shown as subtractions so that p - 1
// renders as "- _k" rather than a 77-digit constant.
//
//===----------------------------------------------------------------------===//

#include "circuit/Expression.hpp"

#include <sstream>

namespace strata::circuit
{
namespace
{
/// @brief Split @p value into a sign and the magnitude shown to users.
bool isDisplayedNegative(const FieldElement &value, FieldElement &magnitude)
{
    FieldElement neg = -value;
    if (!value.isZero() && neg.bitWidth() < value.bitWidth())
    {
        magnitude = neg;
        return true;
    }
    magnitude = value;
    return false;
}

void appendTerm(std::ostringstream &os, bool &first, const FieldElement &coeff,
                const std::string &factors)
{
    FieldElement magnitude;
    bool negative = isDisplayedNegative(coeff, magnitude);
    if (first)
        os << (negative ? "-" : "");
    else
        os << (negative ? " - " : " + ");
    first = false;

    if (factors.empty())
        os << magnitude;
    else if (magnitude.isOne())
        os << factors;
    else
        os << magnitude << '*' << factors;
}
} // namespace

Expression Expression::constantOf(FieldElement value)
{
    Expression e;
    e.constant = value;
    return e;
}

Expression Expression::witnessOf(WitnessId id)
{
    Expression e;
    e.linearTerms.push_back(LinearTerm{FieldElement::one(), id});
    return e;
}

std::optional<FieldElement> evaluate(const Expression &expr, const WitnessMap &witnesses)
{
    FieldElement acc = expr.constant;
    for (const auto &t : expr.mulTerms)
    {
        auto a = witnesses.find(t.lhs);
        auto b = witnesses.find(t.rhs);
        if (a == witnesses.end() || b == witnesses.end())
            return std::nullopt;
        acc = acc + t.coeff * a->second * b->second;
    }
    for (const auto &t : expr.linearTerms)
    {
        auto w = witnesses.find(t.witness);
        if (w == witnesses.end())
            return std::nullopt;
        acc = acc + t.coeff * w->second;
    }
    return acc;
}

std::set<WitnessId> referencedWitnesses(const Expression &expr)
{
    std::set<WitnessId> ids;
    for (const auto &t : expr.mulTerms)
    {
        ids.insert(t.lhs);
        ids.insert(t.rhs);
    }
    for (const auto &t : expr.linearTerms)
        ids.insert(t.witness);
    return ids;
}

std::string toString(const Expression &expr)
{
    std::ostringstream os;
    bool first = true;
    for (const auto &t : expr.mulTerms)
        appendTerm(os, first, t.coeff, witnessName(t.lhs) + "*" + witnessName(t.rhs));
    for (const auto &t : expr.linearTerms)
        appendTerm(os, first, t.coeff, witnessName(t.witness));
    if (!expr.constant.isZero() || first)
        appendTerm(os, first, expr.constant, "");
    return os.str();
}

} // namespace strata::circuit
