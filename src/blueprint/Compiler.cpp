#include "blueprint/Compiler.hpp"
#include "util/process.hpp"
#include "util/files.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

using namespace pc::logging;

namespace pc::blueprint {

std::filesystem::path outputName(const std::filesystem::path& outputDir,
                                 const std::filesystem::path& baseDir,
                                 const std::string& input) {
    std::string name = input;

    if (util::endsWith(name, ".blp")) name.resize(name.size() - 4);
    name += ".ui";

    std::string base = baseDir.generic_string();
    while (!base.empty() && base.back() == '/') base.pop_back();
    if (!base.empty() && name.starts_with(base + "/")) name.erase(0, base.size() + 1);

    std::ranges::replace(name, '/', '-');
    return outputDir / name;
}

std::vector<CompileJob> planCompilation(const std::filesystem::path& outputDir,
                                        const std::filesystem::path& baseDir,
                                        const std::vector<std::string>& inputs) {
    std::vector<CompileJob> jobs;
    jobs.reserve(inputs.size());
    for (const auto& in : inputs) jobs.push_back({in, outputName(outputDir, baseDir, in)});
    return jobs;
}

CompileOutcome compile(const std::string& compiler, const std::vector<CompileJob>& jobs) {
    CompileOutcome outcome;

    for (const auto& job : jobs) {
        LogRegistry::blueprint()->debug("[Compiler] Compiling {} to {}", job.input, job.output.string());

        const auto res = util::run({compiler, "compile", "--output", job.output.string(), job.input});
        outcome.compiler_output += res.stdout_text;

        if (res.exit_code == 0) {
            ++outcome.compiled;
            continue;
        }

        outcome.failed = job;
        outcome.compiler_exit_code = res.exit_code;
        if (res.exit_code == util::EXEC_FAILED) {
            LogRegistry::blueprint()->error("[Compiler] Could not execute blueprint compiler '{}'", compiler);
            outcome.status = CompileStatus::CompilerUnavailable;
        } else {
            LogRegistry::blueprint()->error("[Compiler] {} failed with status {}", job.input, res.exit_code);
            outcome.status = CompileStatus::CompilerFailed;
        }
        break;
    }

    return outcome;
}

}
