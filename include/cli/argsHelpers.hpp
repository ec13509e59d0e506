#pragma once

#include "cli/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pc::cli {

CommandResult invalid(std::string msg);
CommandResult ok(std::string out);

std::optional<std::string> optVal(const CommandCall& c, const std::string& key);
std::optional<std::string> optVal(const CommandCall& c, const std::vector<std::string>& keys);

[[nodiscard]] bool hasFlag(const CommandCall& c, const std::string& key);
[[nodiscard]] bool hasFlag(const CommandCall& c, const std::vector<std::string>& keys);

// -C/--root, defaulting to the current directory
std::filesystem::path projectRoot(const CommandCall& c);

// -c/--config, else <root>/.potcheck.yaml if it exists, else nullopt (built-in defaults)
std::optional<std::filesystem::path> configPath(const CommandCall& c);

// Flags not in `known` (and not global), for reporting typos
std::vector<std::string> unknownFlags(const CommandCall& c, const std::vector<std::string>& known);

}
