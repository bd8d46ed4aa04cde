#include <gtest/gtest.h>
#include "shell/shell.hpp"
#include <sstream>

TEST(ShellTest, CycleScript) {
    std::ostringstream out;
    Shell shell(out);
    bool ok = shell.runScript(
        "new a container\n"
        "new b container list\n"
        "link a b\n"
        "link b a\n"
        "del a\n"
        "del b\n"
        "expect a alive\n"
        "collect\n"
        "expect-collected 2\n"
        "expect a dead\n"
        "expect b dead\n");

    EXPECT_TRUE(ok);
    EXPECT_EQ(shell.lastCollected(), 2u);
    EXPECT_NE(out.str().find("collected 2"), std::string::npos);
    EXPECT_EQ(shell.graph().objectCount(), 0u);
}

TEST(ShellTest, FailedExpectationStopsScript) {
    std::ostringstream out;
    Shell shell(out);
    bool ok = shell.runScript(
        "new a container\n"
        "expect a dead\n"
        "new b container\n");

    EXPECT_FALSE(ok);
    EXPECT_EQ(shell.graph().objectCount(), 1u);
}

TEST(ShellTest, UnknownCommandThrows) {
    std::ostringstream out;
    Shell shell(out);
    EXPECT_THROW(shell.execute("frobnicate x"), ShellError);
    EXPECT_THROW(shell.execute("new a blob"), ShellError);
    EXPECT_THROW(shell.execute("link a b"), ShellError);
    EXPECT_FALSE(shell.runLine("del nobody"));
}

TEST(ShellTest, CommentsAndBlankLinesAreIgnored) {
    std::ostringstream out;
    Shell shell(out);
    EXPECT_TRUE(shell.runScript("# nothing here\n\n   \nnew a atom # trailing\n"));
    EXPECT_EQ(shell.graph().objectCount(), 1u);
}

TEST(ShellTest, GCErrorsAreReported) {
    std::ostringstream out;
    Shell shell(out);
    shell.execute("new a atom");
    shell.execute("new b container");
    EXPECT_THROW(shell.execute("link a b"), InvalidReference);
    EXPECT_THROW(shell.execute("threshold 0 10 10"), InvalidConfiguration);
    EXPECT_THROW(shell.execute("collect 3"), ShellError);
    EXPECT_FALSE(shell.runScript("unlink b a\n"));
}

TEST(ShellTest, BindAddsRootReference) {
    std::ostringstream out;
    Shell shell(out);
    shell.execute("new a container");
    shell.execute("bind c a");
    ObjectId id = shell.resolve("a");
    EXPECT_EQ(shell.resolve("c"), id);
    EXPECT_EQ(shell.graph().strongCount(id), 2u);

    shell.execute("del a");
    EXPECT_TRUE(shell.graph().contains(id));
    shell.execute("del c");
    EXPECT_FALSE(shell.graph().contains(id));
}

TEST(ShellTest, RebindingReleasesPreviousObject) {
    std::ostringstream out;
    Shell shell(out);
    shell.execute("new a atom");
    ObjectId first = shell.resolve("a");
    shell.execute("new a atom");
    EXPECT_FALSE(shell.graph().contains(first));
    EXPECT_NE(shell.resolve("a"), first);
}

TEST(ShellTest, FinalizerLogsAndResurrects) {
    std::ostringstream out;
    Shell shell(out);
    bool ok = shell.runScript(
        "new keep container\n"
        "new a container\n"
        "new b container\n"
        "link a b\n"
        "link b a\n"
        "finalizer a resurrect keep\n"
        "del a\n"
        "del b\n"
        "collect\n"
        "expect-collected 0\n"
        "expect a alive\n"
        "expect b alive\n"
        "unlink keep a\n"
        "collect\n"
        "expect-collected 2\n");

    EXPECT_TRUE(ok);
    std::string text = out.str();
    EXPECT_NE(text.find("finalizing a #"), std::string::npos);
    // Finalizers run once, so the second pass prints nothing new
    EXPECT_EQ(text.find("finalizing a #"), text.rfind("finalizing a #"));
}

TEST(ShellTest, RaisePolicyFailsScript) {
    std::ostringstream out;
    Shell shell(out);
    bool ok = shell.runScript(
        "policy raise\n"
        "new keep container\n"
        "new a container\n"
        "link a a\n"
        "finalizer a resurrect keep\n"
        "del a\n"
        "collect\n"
        "expect a dead\n");

    EXPECT_FALSE(ok);
    EXPECT_TRUE(shell.graph().contains(shell.resolve("a")));
}

TEST(ShellTest, CountAndStatsOutput) {
    std::ostringstream out;
    Shell shell(out);
    shell.execute("new a container");
    shell.execute("new b atom");
    shell.execute("count");
    EXPECT_NE(out.str().find("count: 2 0 0"), std::string::npos);

    shell.execute("collect 0");
    shell.execute("stats");
    EXPECT_NE(out.str().find("gen 0: collections 1 collected 0 uncollectable 0"), std::string::npos);
    EXPECT_NE(out.str().find("objects 2 freed 0"), std::string::npos);
    shell.execute("expect-tracked a 1");
    EXPECT_THROW(shell.execute("expect-tracked a 0"), ShellError);
}

TEST(ShellTest, TrackedListsContainersOnly) {
    std::ostringstream out;
    Shell shell(out);
    shell.execute("new a container");
    shell.execute("new b atom");
    shell.execute("tracked");

    std::string expected = "tracked: #" + std::to_string(shell.resolve("a")) + "\n";
    EXPECT_EQ(out.str(), expected);
}

TEST(ShellTest, ShowDescribesObject) {
    std::ostringstream out;
    Shell shell(out);
    shell.execute("new a container dict");
    shell.execute("new b atom str");
    shell.execute("link a b");
    shell.execute("show a");

    std::string text = out.str();
    EXPECT_NE(text.find("<dict #1> container gen 0 count 1 roots 1 refs [#2]"), std::string::npos);

    shell.execute("del b");
    shell.execute("del a");
    shell.execute("show b");
    EXPECT_NE(out.str().find("b = <freed #2>"), std::string::npos);
}

TEST(ShellTest, SaveAllGarbage) {
    std::ostringstream out;
    Shell shell(out);
    bool ok = shell.runScript(
        "debug saveall\n"
        "new a container\n"
        "link a a\n"
        "del a\n"
        "collect\n"
        "expect-collected 1\n"
        "expect a alive\n"
        "garbage\n"
        "debug none\n"
        "clear-garbage\n"
        "collect\n"
        "expect-collected 1\n"
        "expect a dead\n");

    EXPECT_TRUE(ok);
    EXPECT_NE(out.str().find("garbage: #1"), std::string::npos);
    EXPECT_NE(out.str().find("released 1"), std::string::npos);
}

TEST(ShellTest, ParseDebugFlagList) {
    EXPECT_EQ(parseDebugFlagList("stats"), static_cast<unsigned>(DEBUG_STATS));
    EXPECT_EQ(parseDebugFlagList("stats,saveall"), static_cast<unsigned>(DEBUG_STATS | DEBUG_SAVEALL));
    EXPECT_EQ(parseDebugFlagList("leak"), static_cast<unsigned>(DEBUG_LEAK));
    EXPECT_EQ(parseDebugFlagList("none"), 0u);
    EXPECT_THROW(parseDebugFlagList("verbose"), ShellError);
}

TEST(ShellTest, EchoPrintsCommands) {
    std::ostringstream out;
    Shell shell(out);
    shell.setEcho(true);
    shell.execute("new a atom");
    EXPECT_EQ(out.str(), "> new a atom\n");
}

TEST(ShellTest, DebugStatsGoToShellOutput) {
    std::ostringstream out;
    {
        Shell shell(out);
        shell.execute("debug stats,collectable");
        shell.execute("new a container list");
        shell.execute("link a a");
        shell.execute("del a");
        shell.execute("collect");
    }

    std::string text = out.str();
    EXPECT_NE(text.find("Info: gc: collecting generation 2"), std::string::npos);
    EXPECT_NE(text.find("Info: gc: collectable <list #1>"), std::string::npos);
    EXPECT_NE(text.find("Info: gc: done, 1 unreachable, 0 uncollectable, 1 examined"), std::string::npos);

    // Once the shell is gone diagnostics no longer reach its stream
    size_t length = out.str().size();
    Log::info("after shell");
    EXPECT_EQ(out.str().size(), length);
}
