#include <gtest/gtest.h>
#include "cli/argsHelpers.hpp"
#include "TempProject.hpp"

using namespace pc::cli;

TEST(ArgsHelpersTest, ProjectRootDefaultsToCurrentDirectory) {
    EXPECT_EQ(projectRoot(CommandCall{}), fs::path("."));

    CommandCall call;
    call.options = {{"root", "/srv/app"}};
    EXPECT_EQ(projectRoot(call), fs::path("/srv/app"));
}

TEST(ArgsHelpersTest, ConfigPathPrefersExplicitFlag) {
    CommandCall call;
    call.options = {{"c", "custom.yaml"}};
    EXPECT_EQ(configPath(call), fs::path("custom.yaml"));
}

TEST(ArgsHelpersTest, ConfigPathFallsBackToProjectFile) {
    TempProject p;
    CommandCall call;
    call.options = {{"C", p.root().string()}};
    EXPECT_FALSE(configPath(call).has_value());

    p.write(".potcheck.yaml", "output:\n  color: false\n");
    EXPECT_EQ(configPath(call), p.root() / ".potcheck.yaml");
}

TEST(ArgsHelpersTest, HasFlagIgnoresValuedOptions) {
    CommandCall call;
    call.options = {{"json", std::nullopt}, {"output", "dir"}};
    EXPECT_TRUE(hasFlag(call, "json"));
    EXPECT_FALSE(hasFlag(call, "output"));
    EXPECT_EQ(optVal(call, "output"), "dir");
    EXPECT_TRUE(hasFlag(call, std::vector<std::string>{"s", "json"}));
}

TEST(ArgsHelpersTest, UnknownFlagsSkipGlobals) {
    CommandCall call;
    call.options = {{"v", std::nullopt}, {"no-color", std::nullopt}, {"x", std::nullopt}, {"frobnicate", std::nullopt}};
    EXPECT_EQ(unknownFlags(call, {"json"}), (std::vector<std::string>{"-x", "--frobnicate"}));
}

TEST(ArgsHelpersTest, InvalidPointsToHelp) {
    const auto res = invalid("error: Unknown command: frob");
    EXPECT_EQ(res.exit_code, 1);
    EXPECT_EQ(res.stderr_text, "error: Unknown command: frob\nRun 'potcheck help' for usage.\n");
    EXPECT_TRUE(res.stdout_text.empty());
}
