#pragma once

#include "check/types.hpp"
#include "config/Config.hpp"

#include <filesystem>

namespace pc::check {

// Files of the GResource bundle definition must be listed in byte-wise order
CheckResult checkGResourceOrder(const config::ResourcesConfig& cfg, const std::filesystem::path& projectRoot);

// Entries of the blueprint resource list must exist below blueprint_base and be sorted.
// Missing entries do not stop the ordering check.
CheckResult checkBlueprintList(const config::ResourcesConfig& cfg, const std::filesystem::path& projectRoot);

}
