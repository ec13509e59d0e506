#include "cli/commands.hpp"
#include "cli/Router.hpp"
#include "cli/argsHelpers.hpp"
#include "check/Report.hpp"
#include "config/ConfigRegistry.hpp"

#include <algorithm>
#include <unistd.h>

namespace pc::cli {

void registerAllCommands(Router& r) {
    registerCheckCommands(r);
    registerBlueprintCommands(r);
    registerConfigCommands(r);
    registerHelpCommand(r);
}

bool useColor(const CommandCall& call) {
    if (hasFlag(call, "no-color") || hasFlag(call, "json")) return false;
    if (!config::ConfigRegistry::get().output.color) return false;
    return ::isatty(STDOUT_FILENO) == 1;
}

CommandResult checksResult(const CommandCall& call, const std::vector<check::CheckResult>& results) {
    const bool passed = std::ranges::all_of(results, [](const check::CheckResult& r) { return r.passed(); });
    const int code = static_cast<int>(passed ? check::ExitCode::Ok : check::ExitCode::CheckFailed);

    CommandResult res;
    res.exit_code = code;
    res.has_data = true;
    res.data = {
        {"passed", passed},
        {"exit_code", code},
        {"checks", results}
    };

    if (hasFlag(call, "json")) res.stdout_text = res.data.dump(2) + "\n";
    else res.stdout_text = check::renderText(results, check::Palette{.enabled = useColor(call)});

    return res;
}

}
