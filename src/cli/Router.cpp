#include "cli/Router.hpp"
#include "cli/argsHelpers.hpp"
#include "cli/commands.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <algorithm>
#include <cctype>

using namespace pc::cli;
using namespace pc::logging;

void Router::registerCommand(const std::shared_ptr<CommandUsage>& usage, CommandHandler handler) {
    const std::string key = normalize(usage->primary());

    CommandInfo info{usage, std::move(handler), {}};

    for (const std::string& alias : usage->aliases) {
        const std::string a = normalize(alias);
        if (aliasMap_.contains(a) && aliasMap_.at(a) != key) {
            LogRegistry::cli()->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                     a, aliasMap_.at(a), key);
            continue;
        }
        info.aliases.insert(a);
        aliasMap_[a] = key;
    }

    LogRegistry::cli()->debug("[Router] Registered '{}' (aliases: {})", key, joinAliases(info.aliases));
    if (!commands_.contains(key)) order_.push_back(key);
    commands_[key] = std::move(info);
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    const std::string n = normalize(nameOrAlias);
    if (commands_.contains(n)) return n;
    if (aliasMap_.contains(n)) return aliasMap_.at(n);
    return n; // unknown; let caller error
}

bool Router::knows(const std::string& nameOrAlias) const {
    return commands_.contains(canonicalFor(nameOrAlias));
}

std::vector<std::shared_ptr<CommandUsage>> Router::usages() const {
    std::vector<std::shared_ptr<CommandUsage>> out;
    out.reserve(order_.size());
    for (const auto& key : order_) out.push_back(commands_.at(key).usage);
    return out;
}

CommandResult Router::execute(const CommandCall& call) const {
    const bool wantsHelp = hasFlag(call, std::vector<std::string>{"h", "help"});
    const auto canonical = canonicalFor(call.name.empty() ? (wantsHelp ? "help" : DEFAULT_COMMAND) : call.name);
    LogRegistry::cli()->debug("[Router] Executing command: '{}'", canonical);

    if (!commands_.contains(canonical))
        return invalid(fmt::format("error: Unknown command: {}", call.name));

    const auto& info = commands_.at(canonical);
    if (wantsHelp && canonical != "help") {
        CommandUsage usage = *info.usage;
        usage.theme.enabled = useColor(call);
        return ok(usage.str());
    }

    return info.handler(call);
}

std::string Router::normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (const unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

std::string Router::joinAliases(const std::unordered_set<std::string>& aliases) {
    if (aliases.empty()) return "-";
    std::vector v(aliases.begin(), aliases.end());
    std::ranges::sort(v);
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) { if (i) out += ", "; out += v[i]; }
    return out;
}
