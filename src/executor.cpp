/*
 * archivist - Preservation Workflow Engine
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "archivist/executor.hpp"
#include "archivist/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>
#include <utility>

namespace archivist {

namespace {

void closeFd(int& fd) noexcept {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct Pipe {
    int fds[2] = {-1, -1};

    Pipe() {
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw InfrastructureError(std::string("pipe failed: ") + std::strerror(errno));
        }
    }
    ~Pipe() {
        closeFd(fds[0]);
        closeFd(fds[1]);
    }

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    int& readEnd() noexcept { return fds[0]; }
    int& writeEnd() noexcept { return fds[1]; }
};

// Child side between fork and exec: async-signal-safe calls only.
[[noreturn]] void runChild(char* const* argv, const char* workingDirectory, int outFd, int errFd, int statusFd) {
    int devNull = ::open("/dev/null", O_RDONLY);
    if (devNull >= 0) {
        ::dup2(devNull, STDIN_FILENO);
        if (devNull != STDIN_FILENO) {
            ::close(devNull);
        }
    }
    if (::dup2(outFd, STDOUT_FILENO) < 0 || ::dup2(errFd, STDERR_FILENO) < 0 ||
        ::chdir(workingDirectory) != 0) {
        int err = errno;
        (void)!::write(statusFd, &err, sizeof(err));
        ::_exit(127);
    }

    ::execvp(argv[0], argv);

    int err = errno;
    (void)!::write(statusFd, &err, sizeof(err));
    ::_exit(127);
}

int waitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw InfrastructureError(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return kExecutorFailureCode;
}

}

ProcessExecutor::ProcessExecutor(ExecutorOptions options) noexcept : options_(std::move(options)) {
    LOG_DEBUG("ProcessExecutor created - tools: " +
              (options_.toolsDirectory.empty() ? std::string("(PATH only)") : options_.toolsDirectory.string()) +
              ", output limit: " + std::to_string(options_.outputLimit));
}

std::string ProcessExecutor::resolveExecutable(const std::string& command) const {
    // Bare names are looked up in the tools directory first, then PATH.
    if (options_.toolsDirectory.empty() || command.find('/') != std::string::npos) {
        return command;
    }
    auto candidate = options_.toolsDirectory / command;
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec) && ::access(candidate.c_str(), X_OK) == 0) {
        return candidate.string();
    }
    return command;
}

TaskResult ProcessExecutor::execute(const TaskSpec& spec) {
    TaskResult result;
    result.startTime = Clock::now();

    std::error_code ec;
    if (!std::filesystem::is_directory(spec.workingDirectory, ec)) {
        throw InfrastructureError("Working directory unavailable: " + spec.workingDirectory.string());
    }

    if (!spec.inputFile.empty() && !std::filesystem::exists(spec.inputFile, ec)) {
        result.exitCode = kExecutorFailureCode;
        result.stderrText = "Input file not found: " + spec.inputFile.string();
        result.endTime = Clock::now();
        LOG_WARN(result.stderrText);
        return result;
    }

    std::string executable = resolveExecutable(spec.executable);

    // Everything the child needs is built before fork.
    std::vector<std::string> words;
    words.reserve(spec.arguments.size() + 1);
    words.push_back(executable);
    words.insert(words.end(), spec.arguments.begin(), spec.arguments.end());
    std::vector<char*> argv;
    argv.reserve(words.size() + 1);
    for (auto& word : words) {
        argv.push_back(word.data());
    }
    argv.push_back(nullptr);
    std::string workingDirectory = spec.workingDirectory.string();

    Pipe out;
    Pipe err;
    Pipe status;

    LOG_TRACE("Launching " + executable + " in " + workingDirectory);
    pid_t pid = ::fork();
    if (pid < 0) {
        throw InfrastructureError(std::string("fork failed: ") + std::strerror(errno));
    }
    if (pid == 0) {
        runChild(argv.data(), workingDirectory.c_str(), out.writeEnd(), err.writeEnd(), status.writeEnd());
    }

    closeFd(out.writeEnd());
    closeFd(err.writeEnd());
    closeFd(status.writeEnd());

    // EOF on the status pipe means exec succeeded (close-on-exec).
    int execErrno = 0;
    ssize_t got;
    do {
        got = ::read(status.readEnd(), &execErrno, sizeof(execErrno));
    } while (got < 0 && errno == EINTR);

    if (got == static_cast<ssize_t>(sizeof(execErrno))) {
        (void)waitForChild(pid);
        result.exitCode = kExecutorFailureCode;
        result.stderrText = "Cannot execute " + executable + ": " + std::strerror(execErrno);
        result.endTime = Clock::now();
        LOG_WARN(result.stderrText);
        return result;
    }

    try {
        drain(out.readEnd(), err.readEnd(), result);
    } catch (const InfrastructureError&) {
        ::kill(pid, SIGKILL);
        (void)waitForChild(pid);
        throw;
    }

    result.exitCode = waitForChild(pid);
    result.endTime = Clock::now();

    if (result.truncated) {
        LOG_WARN("Output of " + executable + " truncated to " + std::to_string(options_.outputLimit) + " bytes");
    }

    if (!spec.stdoutFile.empty()) {
        copyStream(spec.stdoutFile, spec.workingDirectory, result.stdoutText);
    }
    if (!spec.stderrFile.empty()) {
        copyStream(spec.stderrFile, spec.workingDirectory, result.stderrText);
    }

    LOG_DEBUG(executable + " exited with " + std::to_string(result.exitCode));
    return result;
}

void ProcessExecutor::drain(int outFd, int errFd, TaskResult& result) const {
    struct pollfd fds[2] = {{outFd, POLLIN, 0}, {errFd, POLLIN, 0}};
    std::string* sinks[2] = {&result.stdoutText, &result.stderrText};
    int open = 2;
    char buffer[8192];

    while (open > 0) {
        int ready = ::poll(fds, 2, -1);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw InfrastructureError(std::string("poll failed: ") + std::strerror(errno));
        }

        for (int i = 0; i < 2; ++i) {
            if (fds[i].fd < 0 || fds[i].revents == 0) {
                continue;
            }
            ssize_t n = ::read(fds[i].fd, buffer, sizeof(buffer));
            if (n < 0 && errno == EINTR) {
                continue;
            }
            if (n <= 0) {
                fds[i].fd = -1;
                --open;
                continue;
            }

            std::string& sink = *sinks[i];
            std::size_t room = sink.size() < options_.outputLimit ? options_.outputLimit - sink.size() : 0;
            std::size_t take = std::min(room, static_cast<std::size_t>(n));
            sink.append(buffer, take);
            if (take < static_cast<std::size_t>(n)) {
                result.truncated = true;
            }
        }
    }
}

void ProcessExecutor::copyStream(const std::filesystem::path& target, const std::filesystem::path& workingDirectory,
                                 const std::string& content) const {
    auto path = target.is_absolute() ? target : workingDirectory / target;
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec || !writeFileAtomic(path, content)) {
        throw InfrastructureError("Cannot write tool output to " + path.string());
    }
}

}
