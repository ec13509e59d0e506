#include "git/StagedFiles.hpp"
#include "util/process.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <sstream>

using namespace pc::logging;

namespace pc::git {

std::vector<std::string> parseNameOnly(const std::string& output) {
    std::vector<std::string> files;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) files.push_back(std::move(line));
    }
    return files;
}

StagedQuery stagedFiles(const std::filesystem::path& projectRoot) {
    StagedQuery q;

    const auto res = util::run({"git", "diff", "--name-only", "--cached", "--relative"}, projectRoot);
    q.git_exit_code = res.exit_code;

    if (res.exit_code == util::EXEC_FAILED) {
        LogRegistry::git()->error("[StagedFiles] Could not execute git");
        q.status = StagedStatus::GitUnavailable;
        return q;
    }

    if (res.exit_code != 0) {
        LogRegistry::git()->error("[StagedFiles] git diff exited with status {}", res.exit_code);
        q.status = StagedStatus::GitFailed;
        return q;
    }

    q.files = parseNameOnly(res.stdout_text);
    q.status = q.files.empty() ? StagedStatus::NoneStaged : StagedStatus::Ok;
    LogRegistry::git()->debug("[StagedFiles] {} staged files", q.files.size());
    return q;
}

bool isStaged(const std::vector<std::string>& staged, const std::filesystem::path& path) {
    const auto wanted = path.lexically_normal().generic_string();
    return std::ranges::any_of(staged, [&](const std::string& s) { return s == wanted; });
}

}
