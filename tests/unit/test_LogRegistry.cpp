#include <gtest/gtest.h>
#include "logging/LogRegistry.hpp"
#include "TempProject.hpp"

using namespace pc::logging;

TEST(LogRegistryTest, SubsystemLoggersExist) {
    ASSERT_TRUE(LogRegistry::isInitialized());
    for (const auto* name : {"potcheck", "manifest", "scan", "check", "git", "blueprint", "cli"})
        EXPECT_NE(LogRegistry::get(name), nullptr) << name;
    EXPECT_EQ(LogRegistry::scan()->name(), "scan");
}

TEST(LogRegistryTest, UnknownLoggerThrows) {
    EXPECT_THROW(LogRegistry::get("vault"), std::runtime_error);
}

TEST(LogRegistryTest, SetConsoleLevelLowersLoggers) {
    LogRegistry::setConsoleLevel(spdlog::level::debug);
    EXPECT_TRUE(LogRegistry::check()->should_log(spdlog::level::debug));
    LogRegistry::setConsoleLevel(spdlog::level::warn);
}

TEST(LogRegistryTest, UncreatableLogDirectoryThrows) {
    EXPECT_THROW(LogRegistry::openFileSink("/proc/potcheck-no-such-dir/potcheck.log"), std::runtime_error);
}

TEST(LogRegistryTest, FileSinkCreatesParentDirectory) {
    TempProject p;
    const auto file = p.root() / "logs/nested/potcheck.log";
    EXPECT_NE(LogRegistry::openFileSink(file), nullptr);
    EXPECT_TRUE(fs::exists(file));
}
