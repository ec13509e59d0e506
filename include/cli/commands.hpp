#pragma once

#include "cli/types.hpp"

#include <vector>

namespace pc::check { struct CheckResult; }

namespace pc::cli {

class Router;

void registerAllCommands(Router& r);

void registerCheckCommands(Router& r);
void registerBlueprintCommands(Router& r);
void registerConfigCommands(Router& r);
void registerHelpCommand(Router& r);

// Colors on when the config allows it, --no-color is absent and stdout is a terminal
[[nodiscard]] bool useColor(const CommandCall& call);

// Text or --json rendering of finished checks; exit code 1 if any failed
CommandResult checksResult(const CommandCall& call, const std::vector<check::CheckResult>& results);

}
