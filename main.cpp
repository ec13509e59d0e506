#include "cli/Parser.hpp"
#include "cli/Router.hpp"
#include "cli/commands.hpp"
#include "cli/argsHelpers.hpp"
#include "config/ConfigRegistry.hpp"
#include "logging/LogRegistry.hpp"
#include "check/types.hpp"

#include <fmt/core.h>
#include <exception>

using namespace pc::cli;
using namespace pc::config;
using namespace pc::logging;

int main(int argc, char** argv) {
    const auto tokens = tokenize(std::vector<std::string>(argv + 1, argv + argc));
    const auto call = parseTokens(tokens);

    try {
        ConfigRegistry::init(configPath(call));
        LogRegistry::init();
    } catch (const std::exception& e) {
        fmt::print(stderr, "error: {}\n", e.what());
        return static_cast<int>(pc::check::ExitCode::CheckFailed);
    }

    if (hasFlag(call, std::vector<std::string>{"v", "verbose"})) LogRegistry::setConsoleLevel(spdlog::level::debug);
    LogRegistry::cli()->debug("[main] argv: {}", to_string(tokens));

    CommandResult res;
    try {
        Router router;
        registerAllCommands(router);
        res = router.execute(call);
    } catch (const std::exception& e) {
        LogRegistry::potcheck()->debug("Command '{}' threw: {}", call.name, e.what());
        fmt::print(stderr, "error: {}\n", e.what());
        return static_cast<int>(pc::check::ExitCode::CheckFailed);
    }

    if (!res.stdout_text.empty()) fmt::print("{}", res.stdout_text);
    if (!res.stderr_text.empty()) fmt::print(stderr, "{}", res.stderr_text);

    spdlog::shutdown();
    return res.exit_code;
}
