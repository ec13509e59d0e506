#include "scan/MarkerScanner.hpp"
#include "scan/DirectoryWalker.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <ranges>
#include <stdexcept>

using namespace pc::logging;
using namespace pc::manifest;

namespace pc::scan {

const std::vector<std::string>& ScanResult::discoveredIn(const Category c) const {
    static const std::vector<std::string> none;
    const auto it = discovered.find(c);
    return it == discovered.end() ? none : it->second;
}

std::size_t ScanResult::total() const {
    std::size_t n = 0;
    for (const auto& files : discovered | std::views::values) n += files.size();
    return n;
}

MarkerScanner::MarkerScanner(const config::PotfilesConfig& cfg)
    : cfg_(cfg), macro_(compile(cfg.disallowed_macro, "disallowed_macro")) {
    for (const auto c : ALL_CATEGORIES)
        markers_.emplace(c, compile(markerFor(c, cfg).pattern, to_string(c) + ".pattern"));
}

std::regex MarkerScanner::compile(const std::string& pattern, const std::string& what) {
    try {
        return std::regex(pattern, std::regex::ECMAScript | std::regex::optimize);
    } catch (const std::regex_error& e) {
        throw std::runtime_error("Invalid pattern for " + what + " '" + pattern + "': " + e.what());
    }
}

bool MarkerScanner::anyLineMatches(const std::string_view content, const std::regex& re) {
    std::size_t pos = 0;
    while (pos < content.size()) {
        auto nl = content.find('\n', pos);
        if (nl == std::string_view::npos) nl = content.size();
        if (std::regex_search(content.begin() + static_cast<std::ptrdiff_t>(pos),
                              content.begin() + static_cast<std::ptrdiff_t>(nl), re)) return true;
        pos = nl + 1;
    }
    return false;
}

bool MarkerScanner::hasMarker(const std::string_view content, const Category c) const {
    return anyLineMatches(content, markers_.at(c));
}

bool MarkerScanner::hasDisallowedMacro(const std::string_view content) const {
    return anyLineMatches(content, macro_);
}

ScanResult MarkerScanner::scan(const std::filesystem::path& projectRoot) const {
    ScanResult result;
    for (const auto c : ALL_CATEGORIES) result.discovered[c];

    const auto scanRoot = projectRoot / cfg_.scan_root;
    LogRegistry::scan()->debug("[MarkerScanner] Scanning {}", scanRoot.string());

    const auto files = DirectoryWalker().walk(scanRoot, [this](const fs::directory_entry& e) {
        return categorize(e.path().filename().string(), cfg_).has_value();
    });

    for (const auto& file : files) {
        const auto rel = file.path.lexically_relative(projectRoot).generic_string();
        const auto category = categorize(rel, cfg_);
        if (!category) continue;

        std::string content;
        try {
            content = util::readFileToString(file.path);
        } catch (const std::runtime_error& e) {
            LogRegistry::scan()->warn("[MarkerScanner] Skipping unreadable file {}: {}", rel, e.what());
            continue;
        }

        if (util::looksBinary(content)) {
            LogRegistry::scan()->debug("[MarkerScanner] Skipping binary file {}", rel);
            continue;
        }

        if (hasMarker(content, *category)) {
            LogRegistry::scan()->debug("[MarkerScanner] {} marker in {}", to_string(*category), rel);
            result.discovered[*category].push_back(rel);
        }

        if (*category == Category::Source && hasDisallowedMacro(content))
            result.macroFiles.push_back(rel);
    }

    for (auto& paths : result.discovered | std::views::values) std::ranges::sort(paths);
    std::ranges::sort(result.macroFiles);

    LogRegistry::scan()->debug("[MarkerScanner] {} files with markers, {} with disallowed macros",
                               result.total(), result.macroFiles.size());
    return result;
}

}
