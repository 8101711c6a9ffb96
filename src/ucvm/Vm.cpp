//===----------------------------------------------------------------------===//
//
// Part of the Strata project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Interpreter for unconstrained blocks.  Every handler first computes all of
// its effects (operand reads, address checks, result values) and only then
// commits them, so a fault never leaves a half-executed instruction behind.
//
//===----------------------------------------------------------------------===//

#include "ucvm/Vm.hpp"

#include <sstream>
#include <type_traits>
#include <utility>

namespace strata::ucvm
{

Vm::Vm(const Block &block, std::vector<FieldElement> calldata)
    : block_(block), calldata_(std::move(calldata)), registers_(block.registerCount),
      memory_(block.memorySize)
{
}

Fault Vm::fault(FaultKind kind, std::string message) const
{
    return Fault{kind, std::move(message), pc_};
}

std::optional<Fault> Vm::checkRegister(RegIndex index) const
{
    if (index < registers_.size())
        return std::nullopt;
    std::ostringstream os;
    os << "register r" << index << " out of range (register file has " << registers_.size()
       << " entries)";
    return fault(FaultKind::InvalidRegisterIndex, os.str());
}

std::optional<Fault> Vm::checkTarget(uint32_t target) const
{
    if (target < block_.code.size())
        return std::nullopt;
    std::ostringstream os;
    os << "jump target @" << target << " outside block '" << block_.name << "' ("
       << block_.code.size() << " instructions)";
    return fault(FaultKind::OutOfBoundsJump, os.str());
}

std::optional<Fault> Vm::checkMemoryRange(uint64_t begin, uint64_t size) const
{
    if (begin + size <= memory_.size())
        return std::nullopt;
    std::ostringstream os;
    os << "memory range [" << begin << ", " << begin + size << ") outside block memory of "
       << memory_.size() << " cells";
    return fault(FaultKind::InvalidMemoryIndex, os.str());
}

support::Expected<FieldElement, Fault> Vm::readReg(RegIndex index) const
{
    if (auto f = checkRegister(index))
        return *f;
    // Registers never written read as zero during execution.
    const auto &slot = registers_[index];
    return slot ? *slot : FieldElement::zero();
}

support::Expected<MemIndex, Fault> Vm::addressIn(RegIndex index) const
{
    auto value = readReg(index);
    if (!value)
        return value.error();
    std::optional<uint64_t> address = value.value().toU64();
    if (!address || *address >= memory_.size())
    {
        std::ostringstream os;
        os << "memory address " << value.value() << " (from r" << index
           << ") outside block memory of " << memory_.size() << " cells";
        return fault(FaultKind::InvalidMemoryIndex, os.str());
    }
    return static_cast<MemIndex>(*address);
}

support::Expected<FieldElement, Fault> Vm::evalBinary(const Binary &in) const
{
    auto lhs = readReg(in.lhs);
    if (!lhs)
        return lhs.error();
    auto rhs = readReg(in.rhs);
    if (!rhs)
        return rhs.error();
    if (auto f = checkRegister(in.dst))
        return *f;

    const FieldElement &a = lhs.value();
    const FieldElement &b = rhs.value();
    switch (in.op)
    {
        case BinaryOp::Add:
            return a + b;
        case BinaryOp::Sub:
            return a - b;
        case BinaryOp::Mul:
            return a * b;
        case BinaryOp::FieldDiv:
        case BinaryOp::IntegerDiv:
        {
            auto q = in.op == BinaryOp::FieldDiv ? a.divide(b) : a.integerDivide(b);
            if (!q)
                return fault(FaultKind::DivisionByZero,
                             std::string("division by zero in ") + std::string(toString(in.op)));
            return *q;
        }
        case BinaryOp::Equals:
            return FieldElement::fromU64(a == b ? 1 : 0);
        case BinaryOp::LessThan:
            return FieldElement::fromU64(a < b ? 1 : 0);
        case BinaryOp::LessThanEquals:
            return FieldElement::fromU64(a <= b ? 1 : 0);
    }
    return fault(FaultKind::Trap, "unknown binary operation");
}

StepResult Vm::advanceTo(uint32_t next)
{
    pc_ = next;
    ++instrCount_;
    StepResult result;
    if (pc_ >= block_.code.size())
    {
        finished_ = true;
        result.status = StepStatus::Finished;
    }
    return result;
}

support::Expected<StepResult, Fault> Vm::step()
{
    if (finished_)
        return fault(FaultKind::Trap, "block '" + block_.name + "' already finished");

    // An empty block finishes on its first step.
    if (pc_ >= block_.code.size())
        return advanceTo(pc_);

    const Instr &instr = block_.code[pc_];
    const uint32_t fallthrough = pc_ + 1;

    // Handlers return either a fault or the committed step result.
    using Outcome = support::Expected<StepResult, Fault>;
    return std::visit(
        [&](const auto &in) -> Outcome {
            using T = std::decay_t<decltype(in)>;
            if constexpr (std::is_same_v<T, Const>)
            {
                if (auto f = checkRegister(in.dst))
                    return *f;
                registers_[in.dst] = in.value;
                return advanceTo(fallthrough);
            }
            else if constexpr (std::is_same_v<T, Mov>)
            {
                auto v = readReg(in.src);
                if (!v)
                    return v.error();
                if (auto f = checkRegister(in.dst))
                    return *f;
                registers_[in.dst] = v.value();
                return advanceTo(fallthrough);
            }
            else if constexpr (std::is_same_v<T, Binary>)
            {
                auto v = evalBinary(in);
                if (!v)
                    return v.error();
                registers_[in.dst] = v.value();
                return advanceTo(fallthrough);
            }
            else if constexpr (std::is_same_v<T, Not>)
            {
                auto v = readReg(in.src);
                if (!v)
                    return v.error();
                if (auto f = checkRegister(in.dst))
                    return *f;
                registers_[in.dst] = FieldElement::one() - v.value();
                return advanceTo(fallthrough);
            }
            else if constexpr (std::is_same_v<T, Jump>)
            {
                if (auto f = checkTarget(in.target))
                    return *f;
                return advanceTo(in.target);
            }
            else if constexpr (std::is_same_v<T, JumpIf> || std::is_same_v<T, JumpIfNot>)
            {
                auto cond = readReg(in.condition);
                if (!cond)
                    return cond.error();
                bool taken = !cond.value().isZero();
                if constexpr (std::is_same_v<T, JumpIfNot>)
                    taken = !taken;
                if (!taken)
                    return advanceTo(fallthrough);
                if (auto f = checkTarget(in.target))
                    return *f;
                return advanceTo(in.target);
            }
            else if constexpr (std::is_same_v<T, Call>)
            {
                if (callStack_.size() >= kMaxCallDepth)
                    return fault(FaultKind::StackOverflow,
                                 "call depth exceeds " + std::to_string(kMaxCallDepth));
                if (auto f = checkTarget(in.target))
                    return *f;
                callStack_.push_back(fallthrough);
                StepResult result = advanceTo(in.target);
                result.status = StepStatus::Called;
                return result;
            }
            else if constexpr (std::is_same_v<T, Return>)
            {
                if (callStack_.empty())
                {
                    StepResult result = advanceTo(pc_);
                    finished_ = true;
                    result.status = StepStatus::Finished;
                    return result;
                }
                uint32_t ret = callStack_.back();
                callStack_.pop_back();
                return advanceTo(ret);
            }
            else if constexpr (std::is_same_v<T, Load>)
            {
                auto addr = addressIn(in.address);
                if (!addr)
                    return addr.error();
                if (auto f = checkRegister(in.dst))
                    return *f;
                registers_[in.dst] = memory_[addr.value()];
                return advanceTo(fallthrough);
            }
            else if constexpr (std::is_same_v<T, Store>)
            {
                auto addr = addressIn(in.address);
                if (!addr)
                    return addr.error();
                auto v = readReg(in.src);
                if (!v)
                    return v.error();
                memory_[addr.value()] = v.value();
                return advanceTo(fallthrough);
            }
            else if constexpr (std::is_same_v<T, CalldataCopy>)
            {
                if (auto f = checkMemoryRange(in.dst, in.size))
                    return *f;
                if (static_cast<uint64_t>(in.offset) + in.size > calldata_.size())
                {
                    std::ostringstream os;
                    os << "calldata range [" << in.offset << ", "
                       << static_cast<uint64_t>(in.offset) + in.size << ") outside "
                       << calldata_.size() << " inputs";
                    return fault(FaultKind::InvalidMemoryIndex, os.str());
                }
                for (uint32_t i = 0; i < in.size; ++i)
                    memory_[in.dst + i] = calldata_[in.offset + i];
                return advanceTo(fallthrough);
            }
            else if constexpr (std::is_same_v<T, Trap>)
            {
                return fault(FaultKind::Trap, in.message.empty() ? "trap" : in.message);
            }
            else if constexpr (std::is_same_v<T, Stop>)
            {
                if (auto f = checkMemoryRange(in.offset, in.size))
                    return *f;
                StepResult result = advanceTo(pc_);
                finished_ = true;
                result.status = StepStatus::Finished;
                result.returnData.assign(memory_.begin() + in.offset,
                                         memory_.begin() + in.offset + in.size);
                return result;
            }
        },
        instr);
}

support::Expected<std::vector<FieldElement>, Fault> Vm::run()
{
    while (true)
    {
        auto r = step();
        if (!r)
            return r.error();
        if (r.value().status == StepStatus::Finished)
            return std::move(r.value().returnData);
    }
}

bool Vm::setRegister(RegIndex index, FieldElement value)
{
    if (index >= registers_.size())
        return false;
    registers_[index] = std::move(value);
    return true;
}

bool Vm::setMemory(MemIndex index, FieldElement value)
{
    if (index >= memory_.size())
        return false;
    memory_[index] = std::move(value);
    return true;
}

} // namespace strata::ucvm
