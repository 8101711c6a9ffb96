// File: tests/unit/DebugScriptTests.cpp
// Purpose: Verify debug script parsing and FIFO action order.
// Key invariants: Comments and blank lines are skipped; unknown commands are
//                 reported on stderr and dropped; an empty script yields Continue.
// Ownership/Lifetime: Temporary script files are removed by each test.
// Links: src/debug/DebugScript.hpp

#include "debug/DebugScript.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

using namespace strata::debug;

namespace
{
std::filesystem::path writeScript(const std::string &name, const std::string &text)
{
    std::filesystem::path path = std::filesystem::temp_directory_path() / name;
    std::ofstream out(path);
    out << text;
    return path;
}
} // namespace

TEST(DebugScriptTest, EmptyScriptContinues)
{
    DebugScript script;
    EXPECT_TRUE(script.empty());
    DebugAction act = script.nextAction();
    EXPECT_EQ(act.kind, DebugActionKind::Continue);
}

TEST(DebugScriptTest, ParsesCommandsInOrder)
{
    DebugScript script;
    EXPECT_TRUE(script.addLine("step"));
    EXPECT_TRUE(script.addLine("  step 3  "));
    EXPECT_TRUE(script.addLine("over"));
    EXPECT_TRUE(script.addLine("next"));
    EXPECT_TRUE(script.addLine("restart"));
    EXPECT_TRUE(script.addLine("continue"));
    EXPECT_TRUE(script.addLine("# comment"));
    EXPECT_TRUE(script.addLine(""));
    ASSERT_EQ(script.size(), 6u);

    DebugAction a = script.nextAction();
    EXPECT_EQ(a.kind, DebugActionKind::Step);
    EXPECT_EQ(a.count, 1u);
    a = script.nextAction();
    EXPECT_EQ(a.kind, DebugActionKind::Step);
    EXPECT_EQ(a.count, 3u);
    EXPECT_EQ(script.nextAction().kind, DebugActionKind::StepOver);
    EXPECT_EQ(script.nextAction().kind, DebugActionKind::Next);
    EXPECT_EQ(script.nextAction().kind, DebugActionKind::Restart);
    EXPECT_EQ(script.nextAction().kind, DebugActionKind::Continue);
    EXPECT_TRUE(script.empty());
}

TEST(DebugScriptTest, SourceStepVariants)
{
    DebugScript script;
    EXPECT_TRUE(script.addLine("next over"));
    EXPECT_TRUE(script.addLine("next out"));
    EXPECT_EQ(script.nextAction().kind, DebugActionKind::NextOver);
    EXPECT_EQ(script.nextAction().kind, DebugActionKind::NextOut);
}

TEST(DebugScriptTest, PeekLeavesActionQueued)
{
    DebugScript script;
    EXPECT_EQ(script.peek().kind, DebugActionKind::Continue);
    script.addStep(4);
    EXPECT_EQ(script.peek().count, 4u);
    EXPECT_EQ(script.size(), 1u);
    EXPECT_EQ(script.nextAction().count, 4u);
    EXPECT_TRUE(script.empty());
}

TEST(DebugScriptTest, UnknownLinesAreReported)
{
    DebugScript script;
    testing::internal::CaptureStderr();
    EXPECT_FALSE(script.addLine("jump 4"));
    EXPECT_FALSE(script.addLine("step two"));
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[DEBUG] ignored: jump 4"), std::string::npos);
    EXPECT_NE(err.find("[DEBUG] ignored: step two"), std::string::npos);
    EXPECT_TRUE(script.empty());
}

TEST(DebugScriptTest, LoadsFromFile)
{
    auto path = writeScript("strata_debug_script_test.txt",
                            "# replay\nstep 2\n\nnext\ncontinue\n");
    DebugScript script(path.string());
    std::filesystem::remove(path);

    ASSERT_EQ(script.size(), 3u);
    DebugAction a = script.nextAction();
    EXPECT_EQ(a.kind, DebugActionKind::Step);
    EXPECT_EQ(a.count, 2u);
    EXPECT_EQ(script.nextAction().kind, DebugActionKind::Next);
    EXPECT_EQ(script.nextAction().kind, DebugActionKind::Continue);
}

TEST(DebugScriptTest, MissingFileIsReported)
{
    testing::internal::CaptureStderr();
    DebugScript script("/nonexistent/strata/script.txt");
    std::string err = testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[DEBUG] unable to open"), std::string::npos);
    EXPECT_TRUE(script.empty());
}

TEST(DebugScriptTest, ProgrammaticActions)
{
    DebugScript script;
    script.addStep(5);
    script.add(DebugActionKind::Step);
    script.add(DebugActionKind::Next);
    EXPECT_EQ(script.nextAction().count, 5u);
    EXPECT_EQ(script.nextAction().count, 1u);
    EXPECT_EQ(script.nextAction().kind, DebugActionKind::Next);
}
