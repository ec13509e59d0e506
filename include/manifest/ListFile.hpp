#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace pc::manifest {

struct ListEntry {
    std::string path;
    std::size_t line = 0;   // 1-based line in the list file
};

// A line-oriented file list: one path per line, blank lines and '#' comments ignored,
// surrounding whitespace trimmed. Order and duplicates are preserved.
struct ListFile {
    std::filesystem::path source;
    std::vector<ListEntry> entries;

    [[nodiscard]] std::vector<std::string> paths() const;
    [[nodiscard]] bool empty() const { return entries.empty(); }
};

ListFile parseListFile(std::string_view content, const std::filesystem::path& source = {});

// Throws std::runtime_error if the file cannot be read.
ListFile loadListFile(const std::filesystem::path& path, const std::filesystem::path& displayName = {});

}
