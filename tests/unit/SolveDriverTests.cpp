// File: tests/unit/SolveDriverTests.cpp
// Purpose: Verify unit-by-unit solving across the outer and inner tiers.
// Key invariants: Stepping every unit yields the reference solver's witness
//                 map; a failing unit commits nothing; restart restores the
//                 initial assignment exactly.
// Ownership/Lifetime: The program outlives the driver that borrows it.
// Links: src/debug/SolveDriver.hpp, src/circuit/Solver.hpp

#include "debug/SolveDriver.hpp"

#include "tests/common/ProgramFixture.hpp"

#include <gtest/gtest.h>

#include <vector>

using namespace strata::debug;
using strata::circuit::Program;
using strata::circuit::WitnessMap;
using strata::test::fe;

namespace
{
/// @brief Step to the end, collecting the kind of every unit.
std::vector<UnitKind> runAll(SolveDriver &driver)
{
    std::vector<UnitKind> kinds;
    while (!driver.finished())
    {
        auto r = driver.stepOne();
        EXPECT_TRUE(r.hasValue());
        if (!r)
            break;
        kinds.push_back(r.value().kind);
    }
    return kinds;
}
} // namespace

TEST(SolveDriverTest, MatchesReferenceSolver)
{
    Program p = strata::test::makeInverseProgram();
    SolveDriver driver(p, strata::test::inverseInputs(1, 2));
    std::vector<UnitKind> kinds = runAll(driver);

    // gate, enter, 9 inner, return, gate, gate
    ASSERT_EQ(kinds.size(), 14u);
    EXPECT_EQ(kinds[0], UnitKind::Gate);
    EXPECT_EQ(kinds[1], UnitKind::EnterBlock);
    EXPECT_EQ(kinds[2], UnitKind::Inner);
    EXPECT_EQ(kinds[11], UnitKind::ReturnBlock);
    EXPECT_EQ(kinds[13], UnitKind::Gate);
    EXPECT_EQ(driver.unitsExecuted(), 14u);

    auto reference = strata::circuit::solveProgram(p, strata::test::inverseInputs(1, 2));
    ASSERT_TRUE(reference.hasValue());
    EXPECT_EQ(driver.witnesses(), reference.value());
}

TEST(SolveDriverTest, AddressesFollowTheTiers)
{
    Program p = strata::test::makeInverseProgram();
    SolveDriver driver(p, strata::test::inverseInputs(1, 2));
    EXPECT_EQ(driver.address(), OpcodeAddress::outerAt(0));

    ASSERT_TRUE(driver.stepOne().hasValue());
    EXPECT_EQ(driver.address(), OpcodeAddress::outerAt(1));

    auto enter = driver.stepOne();
    ASSERT_TRUE(enter.hasValue());
    EXPECT_EQ(enter.value().executed, OpcodeAddress::outerAt(1));
    EXPECT_EQ(driver.address(), OpcodeAddress::innerAt(1, 0));
    EXPECT_TRUE(driver.inner().active());
    EXPECT_EQ(driver.witnesses().size(), 4u);
}

TEST(SolveDriverTest, StepOverBlockRunsWholeBlock)
{
    Program p = strata::test::makeInverseProgram();
    SolveDriver driver(p, strata::test::inverseInputs(1, 2));
    ASSERT_TRUE(driver.stepOne().hasValue());

    ASSERT_TRUE(driver.stepOverBlock().hasValue());
    EXPECT_EQ(driver.address(), OpcodeAddress::outerAt(2));
    EXPECT_FALSE(driver.inner().active());
    EXPECT_EQ(driver.witnesses().size(), 5u);

    // At a gate, step-over executes just that gate.
    ASSERT_TRUE(driver.stepOverBlock().hasValue());
    EXPECT_EQ(driver.address(), OpcodeAddress::outerAt(3));
}

TEST(SolveDriverTest, StepOverReportsEachUnit)
{
    Program p = strata::test::makeInverseProgram();
    SolveDriver driver(p, strata::test::inverseInputs(1, 2));
    ASSERT_TRUE(driver.stepOne().hasValue());

    std::vector<OpcodeAddress> seen;
    ASSERT_TRUE(driver.stepOverBlock([&](const UnitResult &u) { seen.push_back(u.executed); })
                    .hasValue());
    ASSERT_EQ(seen.size(), 11u);
    EXPECT_EQ(seen.front(), OpcodeAddress::outerAt(1));
    EXPECT_EQ(seen.back(), OpcodeAddress::innerAt(1, 9));
    EXPECT_EQ(driver.unitsExecuted(), 12u);
}

TEST(SolveDriverTest, StepOverFromInsideBlock)
{
    Program p = strata::test::makeInverseProgram();
    SolveDriver driver(p, strata::test::inverseInputs(1, 2));
    for (int i = 0; i < 5; ++i)
        ASSERT_TRUE(driver.stepOne().hasValue());
    ASSERT_TRUE(driver.address().isInner());

    ASSERT_TRUE(driver.stepOverBlock().hasValue());
    EXPECT_EQ(driver.address(), OpcodeAddress::outerAt(2));
}

TEST(SolveDriverTest, ZeroPredicateSkipsBlock)
{
    Program p = strata::test::makeInverseProgram();
    std::get<strata::circuit::BlockCall>(p.opcodes[1]).predicate =
        strata::circuit::Expression::constantOf(fe(0));
    p.opcodes.resize(2);

    SolveDriver driver(p, strata::test::inverseInputs(1, 2));
    std::vector<UnitKind> kinds = runAll(driver);
    ASSERT_EQ(kinds.size(), 2u);
    EXPECT_EQ(kinds[1], UnitKind::SkipBlock);
    EXPECT_TRUE(driver.witnesses().at(5).isZero());
}

TEST(SolveDriverTest, EmptyBlockCompletesInOneUnit)
{
    Program p;
    p.blocks.push_back(strata::ucvm::Block{"noop", 0, 0, {}});
    strata::circuit::BlockCall call;
    call.blockId = 0;
    p.opcodes.push_back(call);

    SolveDriver driver(p, {});
    std::vector<UnitKind> kinds = runAll(driver);
    ASSERT_EQ(kinds.size(), 1u);
    EXPECT_EQ(kinds[0], UnitKind::ReturnBlock);
}

TEST(SolveDriverTest, FailingGateCommitsNothing)
{
    Program p = strata::test::makeInverseProgram();
    WitnessMap inputs = strata::test::inverseInputs(1, 2);
    inputs[3] = fe(4);
    SolveDriver driver(p, inputs);

    auto r = driver.stepOne();
    ASSERT_FALSE(r.hasValue());
    EXPECT_EQ(r.error().kind, ErrorKind::UnsatisfiedConstraint);
    EXPECT_EQ(r.error().address, OpcodeAddress::outerAt(0));
    EXPECT_EQ(driver.address(), OpcodeAddress::outerAt(0));
    EXPECT_EQ(driver.witnesses(), inputs);
    EXPECT_EQ(driver.unitsExecuted(), 0u);
}

TEST(SolveDriverTest, MissingBlockInput)
{
    Program p = strata::test::makeInverseProgram();
    WitnessMap inputs = strata::test::inverseInputs(1, 2);
    inputs.erase(2);
    SolveDriver driver(p, inputs);
    ASSERT_TRUE(driver.stepOne().hasValue());

    auto r = driver.stepOne();
    ASSERT_FALSE(r.hasValue());
    EXPECT_EQ(r.error().kind, ErrorKind::MissingInput);
    EXPECT_EQ(r.error().address, OpcodeAddress::outerAt(1));
    EXPECT_FALSE(driver.inner().active());
}

TEST(SolveDriverTest, OutputMismatchRestoresBlock)
{
    Program p = strata::test::makeInverseProgram();
    std::get<strata::circuit::BlockCall>(p.opcodes[1]).outputs = {5, 6};
    SolveDriver driver(p, strata::test::inverseInputs(1, 2));
    for (int i = 0; i < 11; ++i)
        ASSERT_TRUE(driver.stepOne().hasValue());
    ASSERT_EQ(driver.address(), OpcodeAddress::innerAt(1, 9));

    auto r = driver.stepOne();
    ASSERT_FALSE(r.hasValue());
    EXPECT_EQ(r.error().kind, ErrorKind::BlockOutputMismatch);
    EXPECT_EQ(driver.address(), OpcodeAddress::innerAt(1, 9));
    EXPECT_TRUE(driver.inner().active());
    EXPECT_EQ(driver.witnesses().count(5), 0u);
}

TEST(SolveDriverTest, StepLimit)
{
    Program p = strata::test::makeInverseProgram();
    SolveDriver driver(p, strata::test::inverseInputs(1, 2));
    driver.setStepLimit(3);
    for (int i = 0; i < 3; ++i)
        ASSERT_TRUE(driver.stepOne().hasValue());
    auto r = driver.stepOne();
    ASSERT_FALSE(r.hasValue());
    EXPECT_EQ(r.error().kind, ErrorKind::StepLimitExceeded);
    EXPECT_TRUE(isFatal(r.error().kind));
}

TEST(SolveDriverTest, RestartRestoresInitialAssignment)
{
    Program p = strata::test::makeInverseProgram();
    SolveDriver driver(p, strata::test::inverseInputs(1, 2));
    runAll(driver);
    EXPECT_TRUE(driver.finished());

    auto done = driver.stepOne();
    ASSERT_FALSE(done.hasValue());
    EXPECT_EQ(done.error().kind, ErrorKind::InvalidCommandForState);

    driver.restart();
    EXPECT_FALSE(driver.finished());
    EXPECT_EQ(driver.address(), OpcodeAddress::outerAt(0));
    EXPECT_EQ(driver.witnesses(), strata::test::inverseInputs(1, 2));
    EXPECT_EQ(driver.unitsExecuted(), 0u);
}

TEST(SolveDriverTest, WitnessReadWrite)
{
    Program p = strata::test::makeInverseProgram();
    SolveDriver driver(p, strata::test::inverseInputs(1, 2));

    auto missing = driver.readWitness(5);
    ASSERT_FALSE(missing.hasValue());
    EXPECT_EQ(missing.error().kind, ErrorKind::UnknownWitness);

    std::optional<strata::support::FieldElement> previous = driver.writeWitness(1, fe(7));
    ASSERT_TRUE(previous.has_value());
    EXPECT_EQ(*previous, fe(1));
    EXPECT_FALSE(driver.writeWitness(9, fe(1)).has_value());
    EXPECT_EQ(driver.readWitness(1).value(), fe(7));
}
