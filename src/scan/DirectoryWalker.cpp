#include "scan/DirectoryWalker.hpp"
#include "logging/LogRegistry.hpp"

#include <variant>

using DirectoryIteratorVariant = std::variant<
        std::filesystem::directory_iterator,
        std::filesystem::recursive_directory_iterator
>;

using namespace pc::logging;

namespace pc::scan {

    DirectoryWalker::DirectoryWalker(const bool recursive)
            : recursive(recursive) {}

    std::vector<DirectoryWalker::Entry> DirectoryWalker::walk(
            const fs::path& root,
            const std::function<bool(const fs::directory_entry&)>& filter) const
    {
        std::vector<Entry> entries;

        if (!fs::exists(root) || !fs::is_directory(root)) {
            LogRegistry::scan()->warn("[DirectoryWalker] Invalid directory path: {}", root.string());
            return entries;
        }

        constexpr auto opts = fs::directory_options::skip_permission_denied;
        DirectoryIteratorVariant it = recursive
                                      ? DirectoryIteratorVariant{fs::recursive_directory_iterator(root, opts)}
                                      : DirectoryIteratorVariant{fs::directory_iterator(root, opts)};

        std::visit([&filter, &entries](auto&& dir_iter) {
            for (const auto& dir_entry : dir_iter) {
                try {
                    if (dir_entry.is_symlink() || !dir_entry.is_regular_file()) continue;
                    if (filter && !filter(dir_entry)) continue;
                    entries.push_back({dir_entry.path(), dir_entry.file_size()});
                } catch (const fs::filesystem_error& e) {
                    LogRegistry::scan()->warn("[DirectoryWalker] Error accessing {}: {}", dir_entry.path().string(), e.what());
                }
            }
        }, it);

        return entries;
    }

} // namespace pc::scan
