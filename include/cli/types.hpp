#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>
#include <nlohmann/json.hpp>

namespace pc::cli {

class CommandUsage;

struct FlagKV {
    std::string key;                    // without leading dashes
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;           // CLI stdout
    std::string stderr_text;           // CLI stderr
    nlohmann::json data;               // optional machine-readable payload
    bool has_data = false;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::shared_ptr<CommandUsage> usage;
    CommandHandler handler;
    std::unordered_set<std::string> aliases; // own normalized aliases (no dashes)
};

}
