// File: tests/unit/OpcodeAddressTests.cpp
// Purpose: Verify opcode address ordering, text form, breakpoint sets and the
//          debugger error taxonomy.
// Key invariants: Outer addresses order before the inner addresses of the same
//                 opcode; outer(i) and inner(i, j) are distinct breakpoints.
// Ownership/Lifetime: Standalone test executable.
// Links: src/debug/OpcodeAddress.hpp, src/debug/Breakpoints.hpp,
//        src/debug/DebugError.hpp

#include "debug/Breakpoints.hpp"
#include "debug/DebugError.hpp"
#include "debug/OpcodeAddress.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

using namespace strata::debug;

TEST(OpcodeAddressTest, OrdersOuterBeforeInner)
{
    EXPECT_TRUE(OpcodeAddress::outerAt(1) < OpcodeAddress::innerAt(1, 0));
    EXPECT_TRUE(OpcodeAddress::innerAt(1, 0) < OpcodeAddress::innerAt(1, 1));
    EXPECT_TRUE(OpcodeAddress::innerAt(1, 9) < OpcodeAddress::outerAt(2));
    EXPECT_FALSE(OpcodeAddress::outerAt(2) < OpcodeAddress::outerAt(2));
    EXPECT_NE(OpcodeAddress::outerAt(1), OpcodeAddress::innerAt(1, 0));
    EXPECT_EQ(OpcodeAddress::innerAt(1, 3).outerOnly(), OpcodeAddress::outerAt(1));
}

TEST(OpcodeAddressTest, TextForm)
{
    EXPECT_EQ(OpcodeAddress::outerAt(3).toString(), "3");
    EXPECT_EQ(OpcodeAddress::innerAt(3, 1).toString(), "3.1");

    std::ostringstream os;
    os << OpcodeAddress::innerAt(0, 12);
    EXPECT_EQ(os.str(), "0.12");

    EXPECT_EQ(OpcodeAddress::parse("7"), OpcodeAddress::outerAt(7));
    EXPECT_EQ(OpcodeAddress::parse("7.2"), OpcodeAddress::innerAt(7, 2));
    EXPECT_FALSE(OpcodeAddress::parse("").has_value());
    EXPECT_FALSE(OpcodeAddress::parse("7.").has_value());
    EXPECT_FALSE(OpcodeAddress::parse(".2").has_value());
    EXPECT_FALSE(OpcodeAddress::parse("1.2.3").has_value());
    EXPECT_FALSE(OpcodeAddress::parse("-1").has_value());
    EXPECT_FALSE(OpcodeAddress::parse("x").has_value());
}

TEST(BreakpointsTest, AddRemoveIdempotent)
{
    Breakpoints bps;
    EXPECT_TRUE(bps.empty());
    EXPECT_TRUE(bps.add(OpcodeAddress::outerAt(2)));
    EXPECT_FALSE(bps.add(OpcodeAddress::outerAt(2)));
    EXPECT_EQ(bps.size(), 1u);

    EXPECT_TRUE(bps.remove(OpcodeAddress::outerAt(2)));
    EXPECT_FALSE(bps.remove(OpcodeAddress::outerAt(2)));
    EXPECT_TRUE(bps.empty());
}

TEST(BreakpointsTest, TiersAreDistinct)
{
    Breakpoints bps;
    bps.add(OpcodeAddress::outerAt(1));
    EXPECT_TRUE(bps.contains(OpcodeAddress::outerAt(1)));
    EXPECT_FALSE(bps.contains(OpcodeAddress::innerAt(1, 0)));

    bps.add(OpcodeAddress::innerAt(1, 4));
    bps.add(OpcodeAddress::outerAt(0));
    std::vector<OpcodeAddress> expected{
        OpcodeAddress::outerAt(0), OpcodeAddress::outerAt(1), OpcodeAddress::innerAt(1, 4)};
    EXPECT_EQ(bps.all(), expected);

    bps.clear();
    EXPECT_TRUE(bps.all().empty());
}

TEST(DebugErrorTest, FatalClassification)
{
    EXPECT_TRUE(isFatal(ErrorKind::UnsatisfiedConstraint));
    EXPECT_TRUE(isFatal(ErrorKind::DivisionByZero));
    EXPECT_TRUE(isFatal(ErrorKind::StepLimitExceeded));
    EXPECT_FALSE(isFatal(ErrorKind::UnknownBreakpointAddress));
    EXPECT_FALSE(isFatal(ErrorKind::NotYetAvailable));
    EXPECT_FALSE(isFatal(ErrorKind::InvalidCommandForState));
}

TEST(DebugErrorTest, MapsFaultsAndSolveErrors)
{
    using strata::ucvm::Fault;
    using strata::ucvm::FaultKind;
    const OpcodeAddress at = OpcodeAddress::innerAt(1, 7);

    EXPECT_EQ(fromFault(Fault{FaultKind::DivisionByZero, "div", 7}, at).kind,
              ErrorKind::DivisionByZero);
    EXPECT_EQ(fromFault(Fault{FaultKind::StackOverflow, "deep", 0}, at).kind,
              ErrorKind::InnerTrap);
    EXPECT_EQ(fromFault(Fault{FaultKind::Trap, "t", 0}, at).address, at);

    strata::circuit::SolveError missing{
        strata::circuit::SolveErrorKind::MissingInput, "opcode 1: missing", 1, std::nullopt};
    EXPECT_EQ(fromSolveError(missing, OpcodeAddress::outerAt(1)).kind, ErrorKind::MissingInput);

    strata::circuit::SolveError unknown{
        strata::circuit::SolveErrorKind::UnknownBlock, "opcode 1: unknown", 1, std::nullopt};
    EXPECT_EQ(fromSolveError(unknown, OpcodeAddress::outerAt(1)).kind, ErrorKind::InnerTrap);
}

TEST(DebugErrorTest, Rendering)
{
    DebugError err = makeError(ErrorKind::DivisionByZero, "division by zero in fdiv",
                               OpcodeAddress::innerAt(1, 7));
    EXPECT_EQ(toString(err), "DivisionByZero at 1.7: division by zero in fdiv");
    EXPECT_EQ(toString(makeError(ErrorKind::NotExecutingInnerVm, "")), "NotExecutingInnerVm");
}
