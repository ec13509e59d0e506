#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pc::util {

// Exit status the child reports when execvp() itself failed
constexpr int EXEC_FAILED = 127;

// Exit status the child reports when it could not enter cwd
constexpr int CHDIR_FAILED = 126;

struct ExecResult {
    int exit_code = -1;          // 0 on success, 255 if signaled
    std::string stdout_text;     // child stdout
};

// Runs argv[0] (looked up in PATH) with stdout captured and stdin closed.
// Throws std::runtime_error if cwd is not a directory or the pipe or the fork cannot be created.
ExecResult run(const std::vector<std::string>& argv,
               const std::optional<std::filesystem::path>& cwd = std::nullopt);

}
