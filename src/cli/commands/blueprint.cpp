#include "cli/commands.hpp"
#include "cli/Router.hpp"
#include "cli/CommandUsage.hpp"
#include "cli/argsHelpers.hpp"
#include "blueprint/Compiler.hpp"
#include "check/types.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

using namespace pc::blueprint;

namespace pc::cli {

namespace {

const std::vector<std::string> BLUEPRINT_FLAGS{"compiler", "output", "base", "dry-run"};

CommandResult compileBlueprints(const CommandCall& call) {
    if (const auto unknown = unknownFlags(call, BLUEPRINT_FLAGS); !unknown.empty())
        return invalid(fmt::format("error: Unknown option: {}", fmt::join(unknown, ", ")));

    auto compiler = optVal(call, "compiler");
    auto output = optVal(call, "output");
    auto base = optVal(call, "base");
    std::vector<std::string> inputs = call.positionals;

    // Positional form: COMPILER OUTPUT_DIR BASE_INPUT_DIR [INPUT_FILE...]
    if (!compiler && !output && !base) {
        if (inputs.size() < 3)
            return invalid("error: compile-blueprints needs a compiler, an output directory and a base directory");
        compiler = inputs[0];
        output = inputs[1];
        base = inputs[2];
        inputs.erase(inputs.begin(), inputs.begin() + 3);
    }

    if (!output || output->empty()) return invalid("error: Missing --output directory");
    if (!base) base = std::string{};

    const auto jobs = planCompilation(*output, *base, inputs);

    if (hasFlag(call, "dry-run")) {
        std::string out;
        for (const auto& job : jobs) out += fmt::format("{} -> {}\n", job.input, job.output.string());
        return ok(out);
    }

    if (!compiler || compiler->empty()) return invalid("error: Missing --compiler");

    const auto outcome = compile(*compiler, jobs);
    switch (outcome.status) {
    case CompileStatus::Ok:
        return ok(outcome.compiler_output);
    case CompileStatus::CompilerUnavailable:
        return {static_cast<int>(check::ExitCode::MissingDependency), outcome.compiler_output,
                fmt::format("Could not run blueprint compiler '{}'\n", *compiler)};
    case CompileStatus::CompilerFailed:
        break;
    }

    return {static_cast<int>(check::ExitCode::CheckFailed), outcome.compiler_output,
            fmt::format("error: Compiling '{}' failed with status {}\n",
                        outcome.failed ? outcome.failed->input : std::string{}, outcome.compiler_exit_code)};
}

std::shared_ptr<CommandUsage> compileBlueprintsUsage() {
    auto u = std::make_shared<CommandUsage>();
    u->command = "compile-blueprints";
    u->aliases = {"blp"};
    u->description = "Compile blueprint files into UI files that all live in one output directory";
    u->synopsis = "potcheck compile-blueprints --compiler <path> --output <dir> [--base <dir>] [--dry-run] <file>...";
    u->positionals = {{"file...", "Blueprint files to compile, in order", {}}};
    u->required = {
        {"--compiler <path>", "blueprint-compiler executable", {}},
        {"--output <dir>", "Directory receiving every generated UI file", {}}
    };
    u->optional = {
        {"--base <dir>", "Input prefix removed before flattening the path", {}},
        {"--dry-run", "Print the input -> output mapping without compiling", {}}
    };
    u->examples = {
        {"potcheck compile-blueprints --dry-run --output build/ui --base src src/session/view.blp",
         "Prints: src/session/view.blp -> build/ui/session-view.ui"},
        {"potcheck compile-blueprints blueprint-compiler build/ui src src/window.blp",
         "Positional form: compiler, output directory and base directory come first"}
    };
    return u;
}

}

void registerBlueprintCommands(Router& r) {
    r.registerCommand(compileBlueprintsUsage(), compileBlueprints);
}

}
