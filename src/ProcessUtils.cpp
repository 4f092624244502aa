#include "ProcessUtils.h"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fcntl.h>
#include <fstream>
#include <spawn.h>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace ProcessUtils {
namespace {
int waitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    return -1;
}

std::vector<char*> buildArgv(const std::string& executable, const std::vector<std::string>& args) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);
    return argv;
}
} // namespace

std::string findExecutableInPath(const std::string& command) {
    if (command.empty()) return "";
    if (command.find('/') != std::string::npos) {
        return ::access(command.c_str(), X_OK) == 0 ? command : "";
    }
    const char* pathEnv = std::getenv("PATH");
    if (!pathEnv) return "";

    std::stringstream ss{std::string(pathEnv)};
    std::string token;
    while (std::getline(ss, token, ':')) {
        if (token.empty()) token = ".";
        std::filesystem::path candidate = std::filesystem::path(token) / command;
        std::error_code ec;
        if (std::filesystem::exists(candidate, ec) && !ec && ::access(candidate.c_str(), X_OK) == 0) {
            return candidate.string();
        }
    }
    return "";
}

int spawnToFile(const std::string& executable,
                const std::vector<std::string>& args,
                const std::string& outputPath) {
    const int outFd = ::open(outputPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC, 0644);
    if (outFd < 0) return -1;

    // Built before fork so the child only calls async-signal-safe functions.
    std::vector<char*> argv = buildArgv(executable, args);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(outFd);
        return -1;
    }

    if (pid == 0) {
        const int devNull = ::open("/dev/null", O_WRONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDERR_FILENO);
            ::close(devNull);
        }

        if (::dup2(outFd, STDOUT_FILENO) < 0) {
            _exit(127);
        }
        ::close(outFd);

        ::execv(executable.c_str(), argv.data());
        _exit(127);
    }

    ::close(outFd);
    return waitForChild(pid);
}

int spawnWithStderr(const std::string& executable,
                    const std::vector<std::string>& args,
                    const std::string& stderrPath) {
    const int errFd = ::open(stderrPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
    if (errFd < 0) return -1;

    posix_spawn_file_actions_t actions;
    if (::posix_spawn_file_actions_init(&actions) != 0) {
        ::close(errFd);
        return -1;
    }

    if (::posix_spawn_file_actions_adddup2(&actions, errFd, STDERR_FILENO) != 0 ||
        ::posix_spawn_file_actions_addclose(&actions, errFd) != 0) {
        ::posix_spawn_file_actions_destroy(&actions);
        ::close(errFd);
        return -1;
    }

    std::vector<char*> argv = buildArgv(executable, args);
    pid_t pid = -1;
    const int spawnRc = ::posix_spawn(&pid, executable.c_str(), &actions, nullptr, argv.data(), environ);

    ::posix_spawn_file_actions_destroy(&actions);
    ::close(errFd);

    if (spawnRc != 0 || pid <= 0) return -1;
    return waitForChild(pid);
}

std::string firstLineOf(const std::string& path) {
    std::ifstream in(path);
    std::string line;
    if (in) std::getline(in, line);
    return line;
}
} // namespace ProcessUtils
