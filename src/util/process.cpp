#include "util/process.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <system_error>
#include <sys/wait.h>
#include <unistd.h>

using namespace pc::logging;

pc::util::ExecResult pc::util::run(const std::vector<std::string>& argv,
                                   const std::optional<std::filesystem::path>& cwd) {
    if (argv.empty()) throw std::runtime_error("run: empty argument list");

    std::error_code ec;
    if (cwd && !std::filesystem::is_directory(*cwd, ec))
        throw std::runtime_error("Working directory does not exist: " + cwd->string());

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) != 0)
        throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));

    const pid_t pid = fork();
    if (pid < 0) {
        ::close(pipefd[0]); ::close(pipefd[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: stdout to pipe, stdin from /dev/null
        ::close(pipefd[0]);
        if (dup2(pipefd[1], STDOUT_FILENO) == -1) _exit(EXEC_FAILED);
        const int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) dup2(devnull, STDIN_FILENO);
        if (cwd && ::chdir(cwd->c_str()) != 0) _exit(CHDIR_FAILED);
        execvp(args[0], args.data());
        _exit(EXEC_FAILED);
    }

    // Parent: read child's stdout and wait
    ::close(pipefd[1]);
    ExecResult result;
    char buf[4096];
    ssize_t n;
    while ((n = ::read(pipefd[0], buf, sizeof(buf))) > 0 || (n < 0 && errno == EINTR)) {
        if (n > 0) result.stdout_text.append(buf, buf + n);
    }
    ::close(pipefd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
    }

    if (WIFEXITED(status)) result.exit_code = WEXITSTATUS(status);
    else                   result.exit_code = 255; // signaled

    LogRegistry::potcheck()->debug("[process] '{}' exited with {}", argv[0], result.exit_code);
    return result;
}
