#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <vector>

namespace fs = std::filesystem;

namespace pc::scan {

    // Lists regular files below a root. Symbolic links are neither followed nor reported.
    class DirectoryWalker {
    public:
        struct Entry {
            fs::path path;
            std::uintmax_t size;
        };

        explicit DirectoryWalker(bool recursive = true);

        std::vector<Entry> walk(const fs::path& root,
                                const std::function<bool(const fs::directory_entry&)>& filter = nullptr) const;

    private:
        bool recursive;
    };

} // namespace pc::scan
