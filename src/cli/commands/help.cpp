#include "cli/commands.hpp"
#include "cli/Router.hpp"
#include "cli/CommandUsage.hpp"
#include "cli/argsHelpers.hpp"

#include <fmt/core.h>

namespace pc::cli {

namespace {

GroupedOptions globalOptions() {
    return {"Global Options", {
        {"--root <dir>", "Project root every configured path is relative to (default: .)", {"-C"}},
        {"--config <file>", "YAML config file (default: <root>/.potcheck.yaml when present)", {"-c"}},
        {"--verbose", "Log debug output to stderr", {"-v"}},
        {"--no-color", "Disable colored output", {}},
        {"--help", "Show help for a command", {"-h"}}
    }};
}

std::shared_ptr<CommandUsage> helpUsage() {
    auto u = std::make_shared<CommandUsage>();
    u->command = "help";
    u->description = "Show the list of commands, or the full help of one command";
    u->positionals = {{"command", "Command to describe", {}}};
    u->examples = {
        {"potcheck help", "List all commands"},
        {"potcheck help check", "Show every option of the check command"}
    };
    return u;
}

}

void registerHelpCommand(Router& r) {
    r.registerCommand(helpUsage(), [&r](const CommandCall& call) -> CommandResult {
        ColorTheme theme;
        theme.enabled = useColor(call);

        if (!call.positionals.empty()) {
            const auto& name = call.positionals.front();
            if (!r.knows(name)) return invalid(fmt::format("error: Unknown command: {}", name));
            CommandCall sub{name, call.options, {}};
            sub.options.push_back({"help", std::nullopt});
            return r.execute(sub);
        }

        CommandBook book;
        book.title = "potcheck - checks that translation manifests list exactly the files with translatable strings";
        for (const auto& u : r.usages()) book.commands.push_back(*u);
        book.shared = {globalOptions()};
        book.book_theme = theme;
        return ok(book.str());
    });
}

}
