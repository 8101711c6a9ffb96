//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the pausable outer solver.  A unit is one of: solving a gate,
// entering a block (or skipping it when its predicate is zero), or executing
// one instruction of the active block.  The instruction that finishes a block
// also binds the block outputs and moves to the next outer opcode, so the
// witness map only ever changes at outer granularity.
//
//===----------------------------------------------------------------------===//

#include "debug/SolveDriver.hpp"

#include <utility>
#include <variant>
#include <vector>

namespace strata::debug
{

SolveDriver::SolveDriver(const circuit::Program &program, circuit::WitnessMap initial)
    : program_(program), initial_(initial), witnesses_(std::move(initial))
{
}

OpcodeAddress SolveDriver::address() const
{
    if (auto addr = inner_.address())
        return *addr;
    return OpcodeAddress::outerAt(outer_);
}

void SolveDriver::advanceOuter()
{
    ++outer_;
}

/// @brief Execute one unit at the current address.
///
/// @details The step limit is checked before anything runs so that a limit
///          failure, like every other failure, leaves state untouched.
Expected<UnitResult> SolveDriver::stepOne()
{
    if (finished())
        return makeError(ErrorKind::InvalidCommandForState, "program already finished");
    if (stepLimit_ != 0 && units_ >= stepLimit_)
        return makeError(ErrorKind::StepLimitExceeded,
                         "step limit exceeded (" + std::to_string(stepLimit_) + ")",
                         address());

    auto r = inner_.active() ? stepInner() : stepOuter();
    if (r)
        ++units_;
    return r;
}

Expected<UnitResult> SolveDriver::stepOuter()
{
    const uint32_t index = outer_;
    const OpcodeAddress here = OpcodeAddress::outerAt(index);
    const circuit::Opcode &op = program_.opcodes[index];

    if (const auto *gate = std::get_if<circuit::AssertZero>(&op))
    {
        auto outcome = circuit::solveGate(*gate, witnesses_, index);
        if (!outcome)
            return fromSolveError(outcome.error(), here);
        if (const auto &b = outcome.value().binding)
            witnesses_[b->id] = b->value;
        advanceOuter();
        return UnitResult{UnitKind::Gate, here};
    }

    const auto &call = std::get<circuit::BlockCall>(op);
    auto runs = circuit::evaluatePredicate(call, witnesses_, index);
    if (!runs)
        return fromSolveError(runs.error(), here);
    if (!runs.value())
    {
        std::vector<FieldElement> zeros(call.outputs.size(), FieldElement::zero());
        auto bound = circuit::bindOutputs(call, zeros, witnesses_, index);
        if (!bound)
            return fromSolveError(bound.error(), here);
        advanceOuter();
        return UnitResult{UnitKind::SkipBlock, here};
    }

    const ucvm::Block *block = program_.blockAt(index);
    if (!block)
        return makeError(ErrorKind::InnerTrap,
                         "opcode " + std::to_string(index) + ": unknown block id " +
                             std::to_string(call.blockId),
                         here);
    auto inputs = circuit::evaluateInputs(call, witnesses_, index);
    if (!inputs)
        return fromSolveError(inputs.error(), here);

    // A block without instructions has no inner address to pause at.
    if (block->code.empty())
    {
        ucvm::Vm vm(*block, inputs.value());
        auto out = vm.run();
        if (!out)
            return fromFault(out.error(), here);
        auto bound = circuit::bindOutputs(call, out.value(), witnesses_, index);
        if (!bound)
            return fromSolveError(bound.error(), here);
        advanceOuter();
        return UnitResult{UnitKind::ReturnBlock, here};
    }

    inner_.enter(*block, inputs.value(), index);
    return UnitResult{UnitKind::EnterBlock, here};
}

Expected<UnitResult> SolveDriver::stepInner()
{
    const OpcodeAddress here = address();

    // Binding outputs can still fail after the final instruction ran; keep a
    // copy so the block can be put back exactly as it was.
    std::optional<InnerVmAdapter> checkpoint;
    if (inner_.mayFinish())
        checkpoint.emplace(inner_);

    auto r = inner_.stepOne();
    if (!r)
        return r.error();
    if (r.value().kind != InnerStepKind::BlockReturned)
        return UnitResult{UnitKind::Inner, here};

    const auto &call = std::get<circuit::BlockCall>(program_.opcodes[outer_]);
    auto bound = circuit::bindOutputs(call, r.value().outputs, witnesses_, outer_);
    if (!bound)
    {
        if (checkpoint)
            inner_ = std::move(*checkpoint);
        return fromSolveError(bound.error(), here);
    }
    inner_.reset();
    advanceOuter();
    return UnitResult{UnitKind::ReturnBlock, here};
}

Expected<void> SolveDriver::stepOverBlock(const UnitObserver &onUnit)
{
    if (finished())
        return makeError(ErrorKind::InvalidCommandForState, "program already finished");

    auto runUnit = [&]() -> Expected<UnitResult> {
        auto r = stepOne();
        if (r && onUnit)
            onUnit(r.value());
        return r;
    };

    const uint32_t start = outer_;
    if (!inner_.active())
    {
        auto first = runUnit();
        if (!first)
            return first.error();
        if (first.value().kind != UnitKind::EnterBlock)
            return {};
    }
    while (inner_.active() && outer_ == start)
    {
        auto r = runUnit();
        if (!r)
            return r.error();
    }
    return {};
}

void SolveDriver::restart()
{
    witnesses_ = initial_;
    inner_.reset();
    outer_ = 0;
    units_ = 0;
}

Expected<FieldElement> SolveDriver::readWitness(circuit::WitnessId id) const
{
    auto it = witnesses_.find(id);
    if (it == witnesses_.end())
        return makeError(ErrorKind::UnknownWitness,
                         "witness " + circuit::witnessName(id) + " is not bound", address());
    return it->second;
}

std::optional<FieldElement> SolveDriver::writeWitness(circuit::WitnessId id, FieldElement value)
{
    std::optional<FieldElement> previous;
    auto it = witnesses_.find(id);
    if (it != witnesses_.end())
    {
        previous = it->second;
        it->second = std::move(value);
    }
    else
    {
        witnesses_.emplace(id, std::move(value));
    }
    return previous;
}

} // namespace strata::debug
