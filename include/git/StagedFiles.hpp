#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace pc::git {

enum class StagedStatus {
    Ok,
    NoneStaged,
    GitUnavailable,   // git could not be executed
    GitFailed         // git ran but exited non-zero (e.g. not a repository)
};

struct StagedQuery {
    StagedStatus status = StagedStatus::GitFailed;
    std::vector<std::string> files;
    int git_exit_code = -1;
};

// `git diff --name-only --cached --relative` run in projectRoot, so paths are relative to it
StagedQuery stagedFiles(const std::filesystem::path& projectRoot);

// Parses git's newline separated path list; empty lines are dropped
std::vector<std::string> parseNameOnly(const std::string& output);

[[nodiscard]] bool isStaged(const std::vector<std::string>& staged, const std::filesystem::path& path);

}
