//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the debugger's view of an active unconstrained block.  The
// adapter adds the pause-point rules on top of ucvm::Vm: availability of
// memory right after entry, error translation with inner
// addresses, and bounds-checked user writes.
//
//===----------------------------------------------------------------------===//

#include "debug/InnerVmAdapter.hpp"

#include <utility>
#include <variant>

namespace strata::debug
{

InnerVmAdapter::InnerVmAdapter(const InnerVmAdapter &other)
    : vm_(other.vm_ ? std::make_unique<ucvm::Vm>(*other.vm_) : nullptr), outer_(other.outer_),
      stepped_(other.stepped_), earlyWrites_(other.earlyWrites_)
{
}

InnerVmAdapter &InnerVmAdapter::operator=(const InnerVmAdapter &other)
{
    if (this != &other)
    {
        InnerVmAdapter copy(other);
        *this = std::move(copy);
    }
    return *this;
}

void InnerVmAdapter::enter(const ucvm::Block &block,
                           std::vector<FieldElement> inputs,
                           uint32_t outerIndex)
{
    vm_ = std::make_unique<ucvm::Vm>(block, std::move(inputs));
    outer_ = outerIndex;
    stepped_ = false;
    earlyWrites_.clear();
}

void InnerVmAdapter::reset()
{
    vm_.reset();
    stepped_ = false;
    earlyWrites_.clear();
}

DebugError InnerVmAdapter::notActive() const
{
    return makeError(ErrorKind::NotExecutingInnerVm, "no unconstrained block is executing");
}

DebugError InnerVmAdapter::notYetAvailable(const std::string &what) const
{
    return makeError(ErrorKind::NotYetAvailable, what + " not yet available", address());
}

std::optional<OpcodeAddress> InnerVmAdapter::address() const
{
    if (!vm_)
        return std::nullopt;
    return OpcodeAddress::innerAt(outer_, vm_->pc());
}

/// @brief Execute one instruction of the active block.
///
/// @details Faults are translated into debugger errors tagged with the
///          address of the faulting instruction.  The VM guarantees a faulting
///          step has no effect, so the adapter stays at the same position and
///          the caller decides whether to fail the session.
Expected<InnerStep> InnerVmAdapter::stepOne()
{
    if (!vm_)
        return notActive();
    const OpcodeAddress here = OpcodeAddress::innerAt(outer_, vm_->pc());
    auto r = vm_->step();
    if (!r)
        return fromFault(r.error(), here);
    stepped_ = true;
    earlyWrites_.clear();

    InnerStep out;
    switch (r.value().status)
    {
        case ucvm::StepStatus::Continuing:
            out.kind = InnerStepKind::Continuing;
            break;
        case ucvm::StepStatus::Called:
            out.kind = InnerStepKind::CalledNestedBlock;
            break;
        case ucvm::StepStatus::Finished:
            out.kind = InnerStepKind::BlockReturned;
            out.outputs = std::move(r.value().returnData);
            break;
    }
    return out;
}

bool InnerVmAdapter::mayFinish() const
{
    if (!vm_)
        return false;
    const auto &code = vm_->block().code;
    const uint32_t pc = vm_->pc();
    if (pc + 1 >= code.size())
        return true;
    return std::holds_alternative<ucvm::Stop>(code[pc]) ||
           std::holds_alternative<ucvm::Return>(code[pc]);
}

Expected<uint32_t> InnerVmAdapter::pc() const
{
    if (!vm_)
        return notActive();
    return vm_->pc();
}

Expected<FieldElement> InnerVmAdapter::readRegister(ucvm::RegIndex index) const
{
    if (!vm_)
        return notActive();
    const auto &regs = vm_->registers();
    if (index >= regs.size())
        return makeError(ErrorKind::InvalidRegisterIndex,
                         "register r" + std::to_string(index) + " out of range (" +
                             std::to_string(regs.size()) + " registers)",
                         address());
    if (!regs[index])
        return notYetAvailable("register r" + std::to_string(index));
    return *regs[index];
}

Expected<void> InnerVmAdapter::writeRegister(ucvm::RegIndex index, FieldElement value)
{
    if (!vm_)
        return notActive();
    if (!vm_->setRegister(index, std::move(value)))
        return makeError(ErrorKind::InvalidRegisterIndex,
                         "register r" + std::to_string(index) + " out of range (" +
                             std::to_string(vm_->registers().size()) + " registers)",
                         address());
    return {};
}

Expected<FieldElement> InnerVmAdapter::readMemory(ucvm::MemIndex index) const
{
    if (!vm_)
        return notActive();
    const auto &mem = vm_->memory();
    if (index >= mem.size())
        return makeError(ErrorKind::InvalidMemoryIndex,
                         "memory cell " + std::to_string(index) + " out of range (" +
                             std::to_string(mem.size()) + " cells)",
                         address());
    if (!stepped_ && !earlyWrites_.count(index))
        return notYetAvailable("memory cell " + std::to_string(index));
    return mem[index];
}

Expected<void> InnerVmAdapter::writeMemory(ucvm::MemIndex index, FieldElement value)
{
    if (!vm_)
        return notActive();
    if (!vm_->setMemory(index, std::move(value)))
        return makeError(ErrorKind::InvalidMemoryIndex,
                         "memory cell " + std::to_string(index) + " out of range (" +
                             std::to_string(vm_->memory().size()) + " cells)",
                         address());
    if (!stepped_)
        earlyWrites_.insert(index);
    return {};
}

Expected<std::vector<std::optional<FieldElement>>> InnerVmAdapter::registers() const
{
    if (!vm_)
        return notActive();
    return vm_->registers();
}

Expected<std::vector<FieldElement>> InnerVmAdapter::memory() const
{
    if (!vm_)
        return notActive();
    if (!stepped_)
        return notYetAvailable("memory");
    return vm_->memory();
}

Expected<std::vector<uint32_t>> InnerVmAdapter::callStack() const
{
    if (!vm_)
        return notActive();
    return vm_->callStack();
}

} // namespace strata::debug
