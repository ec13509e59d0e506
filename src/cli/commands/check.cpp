#include "cli/commands.hpp"
#include "cli/Router.hpp"
#include "cli/CommandUsage.hpp"
#include "cli/argsHelpers.hpp"
#include "check/PotfilesCheck.hpp"
#include "check/ResourceChecks.hpp"
#include "config/ConfigRegistry.hpp"
#include "git/StagedFiles.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <filesystem>
#include <system_error>

using namespace pc::check;
using namespace pc::logging;

namespace pc::cli {

namespace {

enum class Scope { All, Potfiles, Resources };

const std::vector<std::string> CHECK_FLAGS{"s", "git-staged", "json"};

Entry stagedEntry() {
    return {"--git-staged", "Only check files staged to be committed; stops with exit code 2 if nothing is staged", {"-s"}};
}

Entry jsonEntry() {
    return {"--json", "Print a machine-readable report", {}};
}

CommandResult dependencyMissing(std::string msg) {
    return {static_cast<int>(ExitCode::MissingDependency), "", std::move(msg) + "\n"};
}

CommandResult runChecks(const CommandCall& call, const Scope scope) {
    if (!call.positionals.empty())
        return invalid(fmt::format("error: Unexpected argument: {}", call.positionals.front()));
    if (const auto unknown = unknownFlags(call, CHECK_FLAGS); !unknown.empty())
        return invalid(fmt::format("error: Unknown option: {}", fmt::join(unknown, ", ")));

    const auto& cfg = config::ConfigRegistry::get();
    const auto root = projectRoot(call);
    if (std::error_code ec; !std::filesystem::is_directory(root, ec))
        return invalid(fmt::format("error: Project root '{}' is not a directory", root.string()));
    const bool staged = hasFlag(call, std::vector<std::string>{"s", "git-staged"});

    std::vector<std::string> stagedFiles;
    if (staged) {
        auto q = git::stagedFiles(root);
        switch (q.status) {
        case git::StagedStatus::GitUnavailable:
            return dependencyMissing("Could not check staged files, because git could not be run");
        case git::StagedStatus::GitFailed:
            return dependencyMissing(fmt::format("Could not list staged files, git exited with status {}", q.git_exit_code));
        case git::StagedStatus::NoneStaged:
            return dependencyMissing("Could not check files because none were staged");
        case git::StagedStatus::Ok:
            stagedFiles = std::move(q.files);
            break;
        }
    }

    std::vector<CheckResult> results;

    if (scope != Scope::Resources)
        results.push_back(PotfilesCheck(cfg.potfiles, root).run());

    if (scope != Scope::Potfiles && cfg.resources.enabled) {
        if (!staged || git::isStaged(stagedFiles, cfg.resources.blueprint_list))
            results.push_back(checkBlueprintList(cfg.resources, root));
        else LogRegistry::check()->debug("[check] {} not staged, skipping", cfg.resources.blueprint_list.generic_string());

        if (!staged || git::isStaged(stagedFiles, cfg.resources.gresource))
            results.push_back(checkGResourceOrder(cfg.resources, root));
        else LogRegistry::check()->debug("[check] {} not staged, skipping", cfg.resources.gresource.generic_string());
    }

    return checksResult(call, results);
}

std::shared_ptr<CommandUsage> checkUsage() {
    auto u = std::make_shared<CommandUsage>();
    u->command = "check";
    u->aliases = {"all"};
    u->description = "Run every conformity check (the default command)";
    u->optional = {stagedEntry(), jsonEntry()};
    u->examples = {
        {"potcheck", "Check the project in the current directory"},
        {"potcheck check -s", "Pre-commit hook: resource manifests are only checked when staged"}
    };
    return u;
}

std::shared_ptr<CommandUsage> potfilesUsage() {
    auto u = std::make_shared<CommandUsage>();
    u->command = "potfiles";
    u->aliases = {"po"};
    u->description = "Check the translation manifest against the files containing translatable strings";
    u->optional = {stagedEntry(), jsonEntry()};
    u->examples = {{"potcheck potfiles -C ~/src/app --json", ""}};
    return u;
}

std::shared_ptr<CommandUsage> resourcesUsage() {
    auto u = std::make_shared<CommandUsage>();
    u->command = "resources";
    u->aliases = {"res"};
    u->description = "Check that the resource manifests are sorted and reference existing files";
    u->optional = {stagedEntry(), jsonEntry()};
    return u;
}

}

void registerCheckCommands(Router& r) {
    r.registerCommand(checkUsage(), [](const CommandCall& call) { return runChecks(call, Scope::All); });
    r.registerCommand(potfilesUsage(), [](const CommandCall& call) { return runChecks(call, Scope::Potfiles); });
    r.registerCommand(resourcesUsage(), [](const CommandCall& call) { return runChecks(call, Scope::Resources); });
}

}
