#include "cli/argsHelpers.hpp"

#include <algorithm>
#include <system_error>

using namespace pc::cli;

namespace {

const std::vector<std::string> GLOBAL_FLAGS{
    "h", "help", "v", "verbose", "C", "root", "c", "config", "no-color"
};

constexpr auto DEFAULT_CONFIG_NAME = ".potcheck.yaml";

}

CommandResult pc::cli::invalid(std::string msg) {
    if (!msg.empty() && msg.back() != '\n') msg += '\n';
    msg += "Run 'potcheck help' for usage.\n";
    return {1, "", std::move(msg)};
}

CommandResult pc::cli::ok(std::string out) { return {0, std::move(out), ""}; }

std::optional<std::string> pc::cli::optVal(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return v.value_or(std::string{});
    return std::nullopt;
}

std::optional<std::string> pc::cli::optVal(const CommandCall& c, const std::vector<std::string>& keys) {
    for (const auto& key : keys) if (auto v = optVal(c, key)) return v;
    return std::nullopt;
}

bool pc::cli::hasFlag(const CommandCall& c, const std::string& key) {
    for (const auto& [k, v] : c.options) if (k == key) return !v.has_value();
    return false;
}

bool pc::cli::hasFlag(const CommandCall& c, const std::vector<std::string>& keys) {
    return std::ranges::any_of(keys, [&c](const std::string& k) { return hasFlag(c, k); });
}

std::filesystem::path pc::cli::projectRoot(const CommandCall& c) {
    const auto root = optVal(c, std::vector<std::string>{"C", "root"});
    return root && !root->empty() ? std::filesystem::path(*root) : std::filesystem::path(".");
}

std::optional<std::filesystem::path> pc::cli::configPath(const CommandCall& c) {
    if (const auto explicitPath = optVal(c, std::vector<std::string>{"c", "config"}); explicitPath && !explicitPath->empty())
        return std::filesystem::path(*explicitPath);

    const auto fallback = projectRoot(c) / DEFAULT_CONFIG_NAME;
    std::error_code ec;
    if (std::filesystem::is_regular_file(fallback, ec)) return fallback;
    return std::nullopt;
}

std::vector<std::string> pc::cli::unknownFlags(const CommandCall& c, const std::vector<std::string>& known) {
    std::vector<std::string> out;
    for (const auto& kv : c.options) {
        if (std::ranges::find(GLOBAL_FLAGS, kv.key) != GLOBAL_FLAGS.end()) continue;
        if (std::ranges::find(known, kv.key) != known.end()) continue;
        out.push_back(kv.key.size() == 1 ? "-" + kv.key : "--" + kv.key);
    }
    return out;
}
