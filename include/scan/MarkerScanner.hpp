#pragma once

#include "config/Config.hpp"
#include "manifest/Category.hpp"

#include <filesystem>
#include <map>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace pc::scan {

struct ScanResult {
    // Paths relative to the project root, '/' separated, sorted byte-wise
    std::map<manifest::Category, std::vector<std::string>> discovered;
    std::vector<std::string> macroFiles;

    [[nodiscard]] const std::vector<std::string>& discoveredIn(manifest::Category c) const;
    [[nodiscard]] std::size_t total() const;
};

class MarkerScanner {
public:
    // Throws std::runtime_error naming the offending pattern if one does not compile.
    explicit MarkerScanner(const config::PotfilesConfig& cfg);

    [[nodiscard]] ScanResult scan(const std::filesystem::path& projectRoot) const;

    [[nodiscard]] bool hasMarker(std::string_view content, manifest::Category c) const;
    [[nodiscard]] bool hasDisallowedMacro(std::string_view content) const;

private:
    config::PotfilesConfig cfg_;
    std::map<manifest::Category, std::regex> markers_;
    std::regex macro_;

    static std::regex compile(const std::string& pattern, const std::string& what);
    static bool anyLineMatches(std::string_view content, const std::regex& re);
};

}
