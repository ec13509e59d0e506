#pragma once

#include "check/types.hpp"
#include "config/Config.hpp"
#include "manifest/ListFile.hpp"
#include "scan/MarkerScanner.hpp"

#include <filesystem>
#include <optional>

namespace pc::check {

// Validates the translation manifest against the files a marker scan finds:
// declared entries must exist, declared and discovered files must cancel out per
// category, no source file may use the macro form, and the manifest must be sorted.
class PotfilesCheck {
public:
    PotfilesCheck(const config::PotfilesConfig& cfg, std::filesystem::path projectRoot);

    [[nodiscard]] CheckResult run() const;

    // Steps of run(), exposed for callers that already hold parsed inputs
    [[nodiscard]] CheckResult evaluate(const manifest::ListFile& manifest,
                                       const manifest::ListFile& skip,
                                       const scan::ScanResult& scan) const;

private:
    config::PotfilesConfig cfg_;
    std::filesystem::path root_;
    scan::MarkerScanner scanner_;

    [[nodiscard]] std::optional<manifest::ListFile> loadManifest(CheckResult& result) const;
    [[nodiscard]] manifest::ListFile loadSkip(CheckResult& result) const;
    void reportMissing(const manifest::ListFile& list, CheckResult& result) const;
};

}
