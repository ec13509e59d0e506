#include "check/ResourceChecks.hpp"
#include "check/ordering.hpp"
#include "manifest/GResourceFile.hpp"
#include "manifest/ListFile.hpp"
#include "logging/LogRegistry.hpp"

#include <system_error>

using namespace pc::logging;
using namespace pc::manifest;

namespace pc::check {

namespace {

Discrepancy unreadable(const std::filesystem::path& path, const std::string& why) {
    LogRegistry::check()->error("[ResourceChecks] {}: {}", path.generic_string(), why);
    return {.kind = DiscrepancyKind::UnreadableManifest, .path = path.generic_string(), .detail = why};
}

}

CheckResult checkGResourceOrder(const config::ResourcesConfig& cfg, const std::filesystem::path& projectRoot) {
    CheckResult result;
    result.name = cfg.gresource.generic_string();

    std::vector<std::string> files;
    try {
        files = loadGResourceFiles(projectRoot / cfg.gresource);
    } catch (const std::runtime_error& e) {
        result.discrepancies.push_back(unreadable(cfg.gresource, e.what()));
        result.aborted = true;
        return result;
    }

    if (const auto v = firstOrderViolation(files)) {
        result.discrepancies.push_back({
            .kind = DiscrepancyKind::OrderViolation,
            .path = v->found,
            .origin = result.name,
            .expected = v->expected
        });
    }

    LogRegistry::check()->debug("[ResourceChecks] {}: {} files", result.name, files.size());
    return result;
}

CheckResult checkBlueprintList(const config::ResourcesConfig& cfg, const std::filesystem::path& projectRoot) {
    CheckResult result;
    result.name = cfg.blueprint_list.generic_string();

    ListFile list;
    try {
        list = loadListFile(projectRoot / cfg.blueprint_list, cfg.blueprint_list);
    } catch (const std::runtime_error& e) {
        result.discrepancies.push_back(unreadable(cfg.blueprint_list, e.what()));
        result.aborted = true;
        return result;
    }

    for (const auto& e : list.entries) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(projectRoot / cfg.blueprint_base / e.path, ec)) continue;
        result.discrepancies.push_back({
            .kind = DiscrepancyKind::MissingFile,
            .path = e.path,
            .origin = result.name,
            .line = e.line
        });
    }

    if (const auto v = firstOrderViolation(list.paths())) {
        result.discrepancies.push_back({
            .kind = DiscrepancyKind::OrderViolation,
            .path = v->found,
            .origin = result.name,
            .line = list.entries[v->index].line,
            .expected = v->expected
        });
    }

    return result;
}

}
