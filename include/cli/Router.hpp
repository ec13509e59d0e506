#pragma once

#include "cli/types.hpp"
#include "cli/CommandUsage.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace pc::cli {

class Router {
public:
    static constexpr auto DEFAULT_COMMAND = "check";

    void registerCommand(const std::shared_ptr<CommandUsage>& usage, CommandHandler handler);

    // Dispatches to the named command (DEFAULT_COMMAND if none); -h/--help renders its usage instead
    [[nodiscard]] CommandResult execute(const CommandCall& call) const;

    [[nodiscard]] bool knows(const std::string& nameOrAlias) const;
    [[nodiscard]] std::vector<std::shared_ptr<CommandUsage>> usages() const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::vector<std::string> order_;                          // registration order, for help
    std::unordered_map<std::string, std::string> aliasMap_;   // alias -> canonical

    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;

    static std::string normalize(const std::string& s);
    static std::string joinAliases(const std::unordered_set<std::string>& aliases);
};

} // namespace pc::cli
