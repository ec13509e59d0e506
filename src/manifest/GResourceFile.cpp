#include "manifest/GResourceFile.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <pugixml.hpp>
#include <stdexcept>

using namespace pc::logging;

namespace pc::manifest {

std::vector<std::string> parseGResourceFiles(const std::string_view xml) {
    pugi::xml_document doc;
    const pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());

    if (!result) {
        LogRegistry::manifest()->error("[GResourceFile] Failed to parse XML: {}", result.description());
        throw std::runtime_error(std::string("malformed XML: ") + result.description() +
                                 " at offset " + std::to_string(result.offset));
    }

    const pugi::xml_node root = doc.child("gresources");
    if (!root) throw std::runtime_error("no <gresources> root element");

    std::vector<std::string> files;
    for (const pugi::xml_node bundle : root.children("gresource"))
        for (const pugi::xml_node file : bundle.children("file"))
            files.push_back(util::trim(file.text().as_string()));

    return files;
}

std::vector<std::string> loadGResourceFiles(const std::filesystem::path& path) {
    return parseGResourceFiles(util::readFileToString(path));
}

}
