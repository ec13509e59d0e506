#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace pc::util {

std::string readFileToString(const std::filesystem::path& path);

// Same heuristic as grep -I: a NUL byte in the first block marks the file as binary
[[nodiscard]] bool looksBinary(std::string_view content);

[[nodiscard]] bool endsWith(std::string_view s, std::string_view suffix);

std::string trim(std::string_view s);

std::string generateRandomSuffix(size_t length = 8);

}
