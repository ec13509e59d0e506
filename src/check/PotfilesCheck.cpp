#include "check/PotfilesCheck.hpp"
#include "check/PathCounter.hpp"
#include "check/ordering.hpp"
#include "logging/LogRegistry.hpp"

#include <map>
#include <system_error>

using namespace pc::logging;
using namespace pc::manifest;

namespace pc::check {

namespace {

using Buckets = std::map<Category, std::vector<const ListEntry*>>;

Buckets bucketize(const ListFile& list, const config::PotfilesConfig& cfg) {
    Buckets buckets;
    for (const auto& e : list.entries) {
        if (const auto c = categorize(e.path, cfg)) buckets[*c].push_back(&e);
        else LogRegistry::check()->debug("[PotfilesCheck] {}:{} '{}' has no known extension, not cross-referenced",
                                         list.source.generic_string(), e.line, e.path);
    }
    return buckets;
}

void cancelDeclared(const std::vector<const ListEntry*>& declared, const ListFile& origin,
                    const Category c, PathCounter& found, CheckResult& result) {
    for (const auto* e : declared) {
        if (found.take(e->path)) continue;
        result.discrepancies.push_back({
            .kind = DiscrepancyKind::StaleEntry,
            .path = e->path,
            .origin = origin.source.generic_string(),
            .line = e->line,
            .category = c
        });
    }
}

}

PotfilesCheck::PotfilesCheck(const config::PotfilesConfig& cfg, std::filesystem::path projectRoot)
    : cfg_(cfg), root_(std::move(projectRoot)), scanner_(cfg_) {}

CheckResult PotfilesCheck::run() const {
    CheckResult result;
    result.name = cfg_.manifest.generic_string();

    const auto manifest = loadManifest(result);
    if (!manifest) {
        result.aborted = true;
        return result;
    }
    const auto skip = loadSkip(result);

    reportMissing(*manifest, result);
    reportMissing(skip, result);
    if (!result.passed()) {
        LogRegistry::check()->info("[PotfilesCheck] {} declared files missing, skipping cross-reference",
                                   result.discrepancies.size());
        result.aborted = true;
        return result;
    }

    return evaluate(*manifest, skip, scanner_.scan(root_));
}

CheckResult PotfilesCheck::evaluate(const ListFile& manifest, const ListFile& skip, const scan::ScanResult& scan) const {
    CheckResult result;
    result.name = cfg_.manifest.generic_string();

    const auto declared = bucketize(manifest, cfg_);
    const auto skipped = bucketize(skip, cfg_);

    // Cross-reference, one bucket at a time. Skip entries cancel first.
    for (const auto c : ALL_CATEGORIES) {
        PathCounter found(scan.discoveredIn(c));

        if (const auto it = skipped.find(c); it != skipped.end()) cancelDeclared(it->second, skip, c, found, result);
        if (const auto it = declared.find(c); it != declared.end()) cancelDeclared(it->second, manifest, c, found, result);

        for (auto& path : found.remaining())
            result.discrepancies.push_back({.kind = DiscrepancyKind::UndeclaredFile, .path = std::move(path), .category = c});
    }

    for (const auto& path : scan.macroFiles)
        result.discrepancies.push_back({.kind = DiscrepancyKind::DisallowedMacro, .path = path, .category = Category::Source});

    // Ordering over the categorized manifest entries, in file order
    std::vector<const ListEntry*> ordered;
    for (const auto& e : manifest.entries)
        if (categorize(e.path, cfg_)) ordered.push_back(&e);

    std::vector<std::string> paths;
    paths.reserve(ordered.size());
    for (const auto* e : ordered) paths.push_back(e->path);

    if (const auto v = firstOrderViolation(paths)) {
        result.discrepancies.push_back({
            .kind = DiscrepancyKind::OrderViolation,
            .path = v->found,
            .origin = manifest.source.generic_string(),
            .line = ordered[v->index]->line,
            .expected = v->expected
        });
    }

    LogRegistry::check()->debug("[PotfilesCheck] {}: {} declared, {} skipped, {} discovered, {} discrepancies",
                                result.name, manifest.entries.size(), skip.entries.size(), scan.total(),
                                result.discrepancies.size());
    return result;
}

std::optional<ListFile> PotfilesCheck::loadManifest(CheckResult& result) const {
    try {
        return loadListFile(root_ / cfg_.manifest, cfg_.manifest);
    } catch (const std::runtime_error& e) {
        LogRegistry::check()->error("[PotfilesCheck] {}", e.what());
        result.discrepancies.push_back({
            .kind = DiscrepancyKind::UnreadableManifest,
            .path = cfg_.manifest.generic_string(),
            .detail = e.what()
        });
        return std::nullopt;
    }
}

ListFile PotfilesCheck::loadSkip(CheckResult& result) const {
    std::error_code ec;
    if (!std::filesystem::exists(root_ / cfg_.skip, ec)) {
        LogRegistry::check()->warn("[PotfilesCheck] Skip file {} not found, treating it as empty", cfg_.skip.generic_string());
        return ListFile{cfg_.skip, {}};
    }

    try {
        return loadListFile(root_ / cfg_.skip, cfg_.skip);
    } catch (const std::runtime_error& e) {
        LogRegistry::check()->error("[PotfilesCheck] {}", e.what());
        result.discrepancies.push_back({
            .kind = DiscrepancyKind::UnreadableManifest,
            .path = cfg_.skip.generic_string(),
            .detail = e.what()
        });
        return ListFile{cfg_.skip, {}};
    }
}

void PotfilesCheck::reportMissing(const ListFile& list, CheckResult& result) const {
    for (const auto& e : list.entries) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(root_ / e.path, ec)) continue;
        result.discrepancies.push_back({
            .kind = DiscrepancyKind::MissingFile,
            .path = e.path,
            .origin = list.source.generic_string(),
            .line = e.line
        });
    }
}

}
