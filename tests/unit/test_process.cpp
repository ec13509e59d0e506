#include <gtest/gtest.h>
#include "util/process.hpp"
#include "TempProject.hpp"

using namespace pc::util;

TEST(ProcessTest, CapturesStdoutAndExitCode) {
    const auto res = run({"sh", "-c", "echo hello; exit 3"});
    EXPECT_EQ(res.exit_code, 3);
    EXPECT_EQ(res.stdout_text, "hello\n");
}

TEST(ProcessTest, MissingExecutableReportsExecFailure) {
    const auto res = run({"potcheck-definitely-not-installed"});
    EXPECT_EQ(res.exit_code, EXEC_FAILED);
    EXPECT_TRUE(res.stdout_text.empty());
}

TEST(ProcessTest, RunsInWorkingDirectory) {
    TempProject p;
    const auto res = run({"pwd"}, p.root());
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_EQ(fs::path(res.stdout_text.substr(0, res.stdout_text.size() - 1)), fs::canonical(p.root()));
}

TEST(ProcessTest, StdinIsClosed) {
    const auto res = run({"cat"});
    EXPECT_EQ(res.exit_code, 0);
    EXPECT_TRUE(res.stdout_text.empty());
}

TEST(ProcessTest, EmptyArgvThrows) {
    EXPECT_THROW(run({}), std::runtime_error);
}

TEST(ProcessTest, MissingWorkingDirectoryThrows) {
    TempProject p;
    EXPECT_THROW(run({"true"}, p.root() / "missing"), std::runtime_error);
}
