// File: tests/unit/InnerVmAdapterTests.cpp
// Purpose: Verify single-instruction control and inspection of an active block.
// Key invariants: Nothing is readable before the first instruction executes;
//                 out-of-range inspection is reported, never fatal to the block;
//                 a copied adapter is independent of the original.
// Ownership/Lifetime: The block outlives every adapter that executes it.
// Links: src/debug/InnerVmAdapter.hpp

#include "debug/InnerVmAdapter.hpp"

#include "tests/common/ProgramFixture.hpp"

#include <gtest/gtest.h>

using namespace strata::debug;
using strata::test::fe;
using strata::test::negFe;

TEST(InnerVmAdapterTest, InactiveAdapterRejectsEverything)
{
    InnerVmAdapter adapter;
    EXPECT_FALSE(adapter.active());
    EXPECT_FALSE(adapter.address().has_value());
    EXPECT_EQ(adapter.block(), nullptr);

    auto step = adapter.stepOne();
    ASSERT_FALSE(step.hasValue());
    EXPECT_EQ(step.error().kind, ErrorKind::NotExecutingInnerVm);

    EXPECT_EQ(adapter.readRegister(0).error().kind, ErrorKind::NotExecutingInnerVm);
    EXPECT_EQ(adapter.writeMemory(0, fe(1)).error().kind, ErrorKind::NotExecutingInnerVm);
    EXPECT_EQ(adapter.registers().error().kind, ErrorKind::NotExecutingInnerVm);
}

TEST(InnerVmAdapterTest, NothingAvailableBeforeFirstStep)
{
    strata::ucvm::Block block = strata::test::makeInvertBlock();
    InnerVmAdapter adapter;
    adapter.enter(block, {fe(1), fe(2)}, 1);
    ASSERT_TRUE(adapter.active());
    EXPECT_EQ(adapter.address(), OpcodeAddress::innerAt(1, 0));

    auto regs = adapter.registers();
    ASSERT_TRUE(regs.hasValue());
    ASSERT_EQ(regs.value().size(), 4u);
    for (const auto &r : regs.value())
        EXPECT_FALSE(r.has_value());
    EXPECT_EQ(adapter.memory().error().kind, ErrorKind::NotYetAvailable);
    EXPECT_EQ(adapter.readRegister(0).error().kind, ErrorKind::NotYetAvailable);
    EXPECT_EQ(adapter.readMemory(0).error().kind, ErrorKind::NotYetAvailable);
    EXPECT_EQ(adapter.readRegister(0).error().address, OpcodeAddress::innerAt(1, 0));

    // Range errors are still reported as such.
    EXPECT_EQ(adapter.readRegister(4).error().kind, ErrorKind::InvalidRegisterIndex);
    EXPECT_EQ(adapter.readMemory(2).error().kind, ErrorKind::InvalidMemoryIndex);
}

TEST(InnerVmAdapterTest, UserWritesReadableBeforeFirstStep)
{
    strata::ucvm::Block block = strata::test::makeInvertBlock();
    InnerVmAdapter adapter;
    adapter.enter(block, {fe(1), fe(2)}, 1);

    ASSERT_TRUE(adapter.writeRegister(2, fe(7)).hasValue());
    ASSERT_TRUE(adapter.writeMemory(1, fe(9)).hasValue());
    EXPECT_EQ(adapter.readRegister(2).value(), fe(7));
    EXPECT_EQ(adapter.readMemory(1).value(), fe(9));
    EXPECT_EQ(adapter.readRegister(1).error().kind, ErrorKind::NotYetAvailable);
    EXPECT_EQ(adapter.readMemory(0).error().kind, ErrorKind::NotYetAvailable);
    ASSERT_TRUE(adapter.registers().value()[2].has_value());

    // A new invocation forgets the writes.
    adapter.enter(block, {fe(1), fe(2)}, 1);
    EXPECT_EQ(adapter.readRegister(2).error().kind, ErrorKind::NotYetAvailable);
    EXPECT_EQ(adapter.readMemory(1).error().kind, ErrorKind::NotYetAvailable);
}

TEST(InnerVmAdapterTest, StepsAndInspects)
{
    strata::ucvm::Block block = strata::test::makeInvertBlock();
    InnerVmAdapter adapter;
    adapter.enter(block, {fe(1), fe(2)}, 1);

    auto first = adapter.stepOne();
    ASSERT_TRUE(first.hasValue());
    EXPECT_EQ(first.value().kind, InnerStepKind::Continuing);
    EXPECT_EQ(adapter.address(), OpcodeAddress::innerAt(1, 1));

    // Memory now holds the call data; registers are still unwritten.
    auto m1 = adapter.readMemory(1);
    ASSERT_TRUE(m1.hasValue());
    EXPECT_EQ(m1.value(), fe(2));
    EXPECT_EQ(adapter.readRegister(0).error().kind, ErrorKind::NotYetAvailable);

    auto regs = adapter.registers();
    ASSERT_TRUE(regs.hasValue());
    EXPECT_EQ(regs.value().size(), 4u);
    EXPECT_FALSE(regs.value()[0].has_value());

    ASSERT_TRUE(adapter.stepOne().hasValue());
    auto r0 = adapter.readRegister(0);
    ASSERT_TRUE(r0.hasValue());
    EXPECT_TRUE(r0.value().isZero());
}

TEST(InnerVmAdapterTest, WritesAffectExecution)
{
    strata::ucvm::Block block = strata::test::makeInvertBlock();
    InnerVmAdapter adapter;
    adapter.enter(block, {fe(1), fe(2)}, 1);
    ASSERT_TRUE(adapter.stepOne().hasValue());

    // Replace b with 3 so the block computes 1 / (1 - 3).
    ASSERT_TRUE(adapter.writeMemory(1, fe(3)).hasValue());
    EXPECT_EQ(adapter.writeMemory(5, fe(3)).error().kind, ErrorKind::InvalidMemoryIndex);
    EXPECT_EQ(adapter.writeRegister(9, fe(3)).error().kind, ErrorKind::InvalidRegisterIndex);

    InnerStep last;
    for (int i = 0; i < 20; ++i)
    {
        auto r = adapter.stepOne();
        ASSERT_TRUE(r.hasValue());
        last = r.value();
        if (last.kind == InnerStepKind::BlockReturned)
            break;
    }
    ASSERT_EQ(last.kind, InnerStepKind::BlockReturned);
    ASSERT_EQ(last.outputs.size(), 1u);
    EXPECT_EQ(last.outputs[0] * negFe(2), fe(1));
}

TEST(InnerVmAdapterTest, FaultIsReportedAtInnerAddress)
{
    strata::ucvm::Block block = strata::test::makeInvertBlock();
    InnerVmAdapter adapter;
    adapter.enter(block, {fe(4), fe(4)}, 1);
    for (int i = 0; i < 7; ++i)
        ASSERT_TRUE(adapter.stepOne().hasValue());

    auto r = adapter.stepOne();
    ASSERT_FALSE(r.hasValue());
    EXPECT_EQ(r.error().kind, ErrorKind::DivisionByZero);
    EXPECT_EQ(r.error().address, OpcodeAddress::innerAt(1, 7));
    // The faulting instruction is still next.
    EXPECT_EQ(adapter.address(), OpcodeAddress::innerAt(1, 7));
}

TEST(InnerVmAdapterTest, CopiesAreIndependent)
{
    strata::ucvm::Block block = strata::test::makeInvertBlock();
    InnerVmAdapter adapter;
    adapter.enter(block, {fe(1), fe(2)}, 1);
    ASSERT_TRUE(adapter.stepOne().hasValue());

    InnerVmAdapter saved(adapter);
    ASSERT_TRUE(adapter.stepOne().hasValue());
    ASSERT_TRUE(adapter.writeMemory(0, fe(77)).hasValue());

    EXPECT_EQ(saved.address(), OpcodeAddress::innerAt(1, 1));
    EXPECT_EQ(saved.readMemory(0).value(), fe(1));

    adapter = saved;
    EXPECT_EQ(adapter.address(), OpcodeAddress::innerAt(1, 1));
    EXPECT_EQ(adapter.readMemory(0).value(), fe(1));
}

TEST(InnerVmAdapterTest, MayFinishAtStopAndEnd)
{
    strata::ucvm::Block block = strata::test::makeDoubleBlock();
    InnerVmAdapter adapter;
    adapter.enter(block, {fe(5)}, 0);
    EXPECT_FALSE(adapter.mayFinish());
    ASSERT_TRUE(adapter.stepOne().hasValue());

    auto call = adapter.stepOne();
    ASSERT_TRUE(call.hasValue());
    EXPECT_EQ(call.value().kind, InnerStepKind::CalledNestedBlock);
    auto stack = adapter.callStack();
    ASSERT_TRUE(stack.hasValue());
    ASSERT_EQ(stack.value().size(), 1u);

    // Run the callee body up to its return; return may finish a block.
    for (int i = 0; i < 4; ++i)
        ASSERT_TRUE(adapter.stepOne().hasValue());
    EXPECT_TRUE(adapter.mayFinish());
    ASSERT_TRUE(adapter.stepOne().hasValue());
    EXPECT_EQ(adapter.address(), OpcodeAddress::innerAt(0, 2));
    EXPECT_TRUE(adapter.mayFinish());

    adapter.reset();
    EXPECT_FALSE(adapter.active());
}
