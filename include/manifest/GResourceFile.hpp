#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace pc::manifest {

// Paths of all <gresources><gresource><file> elements, in document order.
// Throws std::runtime_error on malformed XML or a missing <gresources> root.
std::vector<std::string> parseGResourceFiles(std::string_view xml);

std::vector<std::string> loadGResourceFiles(const std::filesystem::path& path);

}
