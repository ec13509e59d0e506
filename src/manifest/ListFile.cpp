#include "manifest/ListFile.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

using namespace pc::logging;

namespace pc::manifest {

std::vector<std::string> ListFile::paths() const {
    std::vector<std::string> out;
    out.reserve(entries.size());
    for (const auto& e : entries) out.push_back(e.path);
    return out;
}

ListFile parseListFile(const std::string_view content, const std::filesystem::path& source) {
    ListFile list;
    list.source = source;

    std::size_t lineNo = 0;
    std::size_t pos = 0;
    while (pos <= content.size()) {
        const auto nl = content.find('\n', pos);
        const auto raw = content.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        ++lineNo;

        auto line = util::trim(raw);
        if (!line.empty() && line.front() != '#')
            list.entries.push_back({std::move(line), lineNo});

        if (nl == std::string_view::npos) break;
        pos = nl + 1;
    }

    LogRegistry::manifest()->debug("[ListFile] {}: {} entries", source.generic_string(), list.entries.size());
    return list;
}

ListFile loadListFile(const std::filesystem::path& path, const std::filesystem::path& displayName) {
    return parseListFile(util::readFileToString(path), displayName.empty() ? path : displayName);
}

}
