#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace pc::blueprint {

// All UI files are compiled into one directory. The output name is the input path
// relative to baseDir with the .blp extension replaced by .ui and '/' replaced by '-',
// so the gresource definition can map it back to its original path with an alias.
std::filesystem::path outputName(const std::filesystem::path& outputDir,
                                 const std::filesystem::path& baseDir,
                                 const std::string& input);

struct CompileJob {
    std::string input;
    std::filesystem::path output;
};

std::vector<CompileJob> planCompilation(const std::filesystem::path& outputDir,
                                        const std::filesystem::path& baseDir,
                                        const std::vector<std::string>& inputs);

enum class CompileStatus { Ok, CompilerFailed, CompilerUnavailable };

struct CompileOutcome {
    CompileStatus status = CompileStatus::Ok;
    std::size_t compiled = 0;
    std::optional<CompileJob> failed;
    int compiler_exit_code = 0;
    std::string compiler_output;
};

// Runs `<compiler> compile --output <out> <in>` per job, stopping at the first failure
CompileOutcome compile(const std::string& compiler, const std::vector<CompileJob>& jobs);

}
