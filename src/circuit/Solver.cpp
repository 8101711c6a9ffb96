//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Gate solving works on a partially evaluated copy of the expression: every
// product whose factors are known folds into the constant, a product with a
// single unknown factor becomes a linear term in that unknown, and linear
// terms over the same witness are merged.  What remains decides the outcome.
//
//===----------------------------------------------------------------------===//

#include "circuit/Solver.hpp"

#include <iterator>
#include <map>
#include <sstream>

namespace strata::circuit
{
namespace
{
SolveError makeError(SolveErrorKind kind, size_t index, const std::string &detail)
{
    std::ostringstream os;
    os << "opcode " << index << ": " << detail;
    return SolveError{kind, os.str(), index, std::nullopt};
}

std::string listWitnesses(const std::map<WitnessId, FieldElement> &ids)
{
    std::string out;
    for (const auto &entry : ids)
    {
        if (!out.empty())
            out += ", ";
        out += witnessName(entry.first);
    }
    return out;
}

std::string missingIn(const Expression &expr, const WitnessMap &witnesses)
{
    std::string out;
    for (WitnessId id : referencedWitnesses(expr))
    {
        if (witnesses.count(id))
            continue;
        if (!out.empty())
            out += ", ";
        out += witnessName(id);
    }
    return out;
}
} // namespace

support::Expected<GateOutcome, SolveError>
solveGate(const AssertZero &gate, const WitnessMap &witnesses, size_t index)
{
    const Expression &expr = gate.expr;
    FieldElement constant = expr.constant;
    std::map<WitnessId, FieldElement> unknown;
    size_t unresolvedProducts = 0;

    auto lookup = [&](WitnessId id) -> const FieldElement * {
        auto it = witnesses.find(id);
        return it == witnesses.end() ? nullptr : &it->second;
    };

    for (const auto &t : expr.mulTerms)
    {
        if (t.coeff.isZero())
            continue;
        const FieldElement *a = lookup(t.lhs);
        const FieldElement *b = lookup(t.rhs);
        if (a && b)
            constant = constant + t.coeff * *a * *b;
        else if (a)
            unknown[t.rhs] = unknown[t.rhs] + t.coeff * *a;
        else if (b)
            unknown[t.lhs] = unknown[t.lhs] + t.coeff * *b;
        else
            ++unresolvedProducts;
    }
    for (const auto &t : expr.linearTerms)
    {
        if (const FieldElement *w = lookup(t.witness))
            constant = constant + t.coeff * *w;
        else
            unknown[t.witness] = unknown[t.witness] + t.coeff;
    }
    for (auto it = unknown.begin(); it != unknown.end();)
        it = it->second.isZero() ? unknown.erase(it) : std::next(it);

    if (unresolvedProducts > 0)
        return makeError(SolveErrorKind::MissingInput, index,
                         "cannot solve product of unassigned witnesses (" +
                             missingIn(expr, witnesses) + ")");

    if (unknown.empty())
    {
        if (constant.isZero())
            return GateOutcome{};
        return makeError(SolveErrorKind::UnsatisfiedConstraint, index,
                         "constraint " + toString(expr) + " = 0 evaluates to " +
                             constant.toString());
    }

    if (unknown.size() > 1)
        return makeError(SolveErrorKind::MissingInput, index,
                         "too many unassigned witnesses (" + listWitnesses(unknown) + ")");

    const auto &[id, coeff] = *unknown.begin();
    // coeff * w + constant = 0  =>  w = -constant / coeff; coeff is non-zero here.
    std::optional<FieldElement> value = (-constant).divide(coeff);
    return GateOutcome{Binding{id, *value}};
}

support::Expected<std::vector<FieldElement>, SolveError>
evaluateInputs(const BlockCall &call, const WitnessMap &witnesses, size_t index)
{
    std::vector<FieldElement> values;
    values.reserve(call.inputs.size());
    for (size_t i = 0; i < call.inputs.size(); ++i)
    {
        std::optional<FieldElement> v = evaluate(call.inputs[i], witnesses);
        if (!v)
            return makeError(SolveErrorKind::MissingInput, index,
                             "block input " + std::to_string(i) + " depends on unassigned " +
                                 missingIn(call.inputs[i], witnesses));
        values.push_back(*v);
    }
    return values;
}

support::Expected<bool, SolveError>
evaluatePredicate(const BlockCall &call, const WitnessMap &witnesses, size_t index)
{
    if (!call.predicate)
        return true;
    std::optional<FieldElement> v = evaluate(*call.predicate, witnesses);
    if (!v)
        return makeError(SolveErrorKind::MissingInput, index,
                         "block predicate depends on unassigned " +
                             missingIn(*call.predicate, witnesses));
    return !v->isZero();
}

support::Expected<void, SolveError> bindOutputs(const BlockCall &call,
                                                const std::vector<FieldElement> &values,
                                                WitnessMap &witnesses,
                                                size_t index)
{
    if (values.size() != call.outputs.size())
        return makeError(SolveErrorKind::BlockOutputMismatch, index,
                         "block returned " + std::to_string(values.size()) + " values for " +
                             std::to_string(call.outputs.size()) + " outputs");

    WitnessMap staged;
    for (size_t i = 0; i < values.size(); ++i)
    {
        WitnessId id = call.outputs[i];
        auto existing = witnesses.find(id);
        auto pending = staged.find(id);
        const FieldElement *prior = existing != witnesses.end() ? &existing->second
                                    : pending != staged.end()   ? &pending->second
                                                                : nullptr;
        if (prior && *prior != values[i])
            return makeError(SolveErrorKind::UnsatisfiedConstraint, index,
                             "output " + witnessName(id) + " = " + prior->toString() +
                                 " conflicts with block result " + values[i].toString());
        staged.emplace(id, values[i]);
    }
    for (auto &[id, value] : staged)
        witnesses[id] = value;
    return {};
}

support::Expected<WitnessMap, SolveError> solveProgram(const Program &program, WitnessMap initial)
{
    WitnessMap witnesses = std::move(initial);
    for (size_t index = 0; index < program.opcodes.size(); ++index)
    {
        const Opcode &op = program.opcodes[index];
        if (const auto *gate = std::get_if<AssertZero>(&op))
        {
            auto outcome = solveGate(*gate, witnesses, index);
            if (!outcome)
                return outcome.error();
            if (const auto &b = outcome.value().binding)
                witnesses[b->id] = b->value;
            continue;
        }

        const auto &call = std::get<BlockCall>(op);
        auto runs = evaluatePredicate(call, witnesses, index);
        if (!runs)
            return runs.error();
        std::vector<FieldElement> results;
        if (!runs.value())
        {
            results.assign(call.outputs.size(), FieldElement::zero());
        }
        else
        {
            const ucvm::Block *block = program.blockAt(index);
            if (!block)
                return makeError(SolveErrorKind::UnknownBlock, index,
                                 "unknown block id " + std::to_string(call.blockId));
            auto inputs = evaluateInputs(call, witnesses, index);
            if (!inputs)
                return inputs.error();
            ucvm::Vm vm(*block, inputs.value());
            auto ran = vm.run();
            if (!ran)
            {
                SolveError err = makeError(SolveErrorKind::BlockFault, index, ran.error().message);
                err.fault = ran.error();
                return err;
            }
            results = ran.value();
        }
        auto bound = bindOutputs(call, results, witnesses, index);
        if (!bound)
            return bound.error();
    }
    return witnesses;
}

} // namespace strata::circuit
