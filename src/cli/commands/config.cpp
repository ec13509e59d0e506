#include "cli/commands.hpp"
#include "cli/Router.hpp"
#include "cli/CommandUsage.hpp"
#include "cli/argsHelpers.hpp"
#include "config/ConfigRegistry.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

namespace pc::cli {

namespace {

CommandResult showConfig(const CommandCall& call) {
    if (!call.positionals.empty())
        return invalid(fmt::format("error: Unexpected argument: {}", call.positionals.front()));
    if (const auto unknown = unknownFlags(call, {"json"}); !unknown.empty())
        return invalid(fmt::format("error: Unknown option: {}", fmt::join(unknown, ", ")));

    nlohmann::json j = config::ConfigRegistry::get();
    const auto source = configPath(call);
    j["source"] = source ? source->generic_string() : std::string("<defaults>");

    CommandResult res = ok(j.dump(2) + "\n");
    res.data = std::move(j);
    res.has_data = true;
    return res;
}

std::shared_ptr<CommandUsage> configUsage() {
    auto u = std::make_shared<CommandUsage>();
    u->command = "config";
    u->aliases = {"cfg"};
    u->description = "Print the effective configuration as JSON, after defaults and the config file are merged";
    u->examples = {
        {"potcheck config -C ../app", "Show which manifest, skip file and patterns ../app is checked with"}
    };
    return u;
}

}

void registerConfigCommands(Router& r) {
    r.registerCommand(configUsage(), showConfig);
}

}
