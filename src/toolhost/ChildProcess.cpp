//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.cpp
// Purpose: fork/execve based subprocess management
//==========================================================================================================

#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/wait.h>

#include <cstring>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "toolhost/ChildProcess.hpp"

extern char** environ;

namespace toolhost {

namespace {
std::once_flag sigpipeOnce;

// Writes to a dead child's stdin must surface as EPIPE, not kill the host process.
void ignoreSigpipe() {
    std::call_once(sigpipeOnce, []() {
        struct sigaction sa{};
        sa.sa_handler = SIG_IGN;
        ::sigemptyset(&sa.sa_mask);
        if (::sigaction(SIGPIPE, &sa, nullptr) != 0) {
            LOG_WARN("ChildProcess: failed to ignore SIGPIPE (errno={} msg={})", errno, ::strerror(errno));
        }
    });
}

bool isExecutableFile(const std::string& path) {
    struct stat st{};
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode) && ::access(path.c_str(), X_OK) == 0;
}

void closeFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct PipePair {
    int fds[2]{-1, -1};
    ~PipePair() { closeFd(fds[0]); closeFd(fds[1]); }
    bool open() { return ::pipe2(fds, O_CLOEXEC) == 0; }
    int release(int idx) { int fd = fds[idx]; fds[idx] = -1; return fd; }
};
} // namespace

ChildProcess::ChildProcess(pid_t pid, int stdinFd, int stdoutFd, int stderrFd)
    : pid_(pid), stdinFd_(stdinFd), stdoutFd_(stdoutFd), stderrFd_(stderrFd) {}

ChildProcess::~ChildProcess() {
    FUNC_SCOPE();
    if (IsAlive() && !Terminate(std::chrono::milliseconds(500))) {
        LOG_ERROR("ChildProcess: pid {} could not be reaped on destruction", static_cast<int>(pid_));
    }
    closeFd(stdinFd_);
    closeFd(stdoutFd_);
    closeFd(stderrFd_);
}

std::string ChildProcess::ResolveExecutable(const std::string& command, const std::optional<std::string>& pathEnv) {
    if (command.empty()) {
        return std::string();
    }
    if (command.find('/') != std::string::npos) {
        return isExecutableFile(command) ? command : std::string();
    }
    const std::string path = pathEnv.has_value() ? *pathEnv : GetEnvOrDefault("PATH", "/usr/local/bin:/usr/bin:/bin");
    std::size_t start = 0;
    while (start <= path.size()) {
        std::size_t end = path.find(':', start);
        if (end == std::string::npos) {
            end = path.size();
        }
        std::string dir = path.substr(start, end - start);
        if (dir.empty()) {
            dir = ".";
        }
        std::string candidate = dir + "/" + command;
        if (isExecutableFile(candidate)) {
            return candidate;
        }
        start = end + 1;
    }
    return std::string();
}

std::unique_ptr<ChildProcess> ChildProcess::Spawn(const std::string& command,
                                                  const std::vector<std::string>& args,
                                                  const std::map<std::string, std::string>& env) {
    FUNC_SCOPE();
    ignoreSigpipe();

    // Everything the child needs is prepared before fork; only async-signal-safe calls follow it.
    std::string exePath = ResolveExecutable(command);
    if (exePath.empty()) {
        LOG_WARN("ChildProcess: '{}' not found on PATH; attempting to execute as given", command);
        exePath = command;
    }

    std::vector<std::string> argvStore;
    argvStore.reserve(args.size() + 1);
    argvStore.push_back(command);
    argvStore.insert(argvStore.end(), args.begin(), args.end());
    std::vector<char*> argv;
    for (auto& a : argvStore) {
        argv.push_back(a.data());
    }
    argv.push_back(nullptr);

    std::map<std::string, std::string> merged;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        std::size_t eq = entry.find('=');
        if (eq != std::string::npos) {
            merged[entry.substr(0, eq)] = entry.substr(eq + 1);
        }
    }
    for (const auto& [k, v] : env) {
        merged[k] = v;
    }
    std::vector<std::string> envStore;
    envStore.reserve(merged.size());
    for (const auto& [k, v] : merged) {
        envStore.push_back(k + "=" + v);
    }
    std::vector<char*> envp;
    for (auto& e : envStore) {
        envp.push_back(e.data());
    }
    envp.push_back(nullptr);

    PipePair in, out, err, status;
    if (!in.open() || !out.open() || !err.open() || !status.open()) {
        throw std::runtime_error(std::string("pipe failed: ") + ::strerror(errno));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        throw std::runtime_error(std::string("fork failed: ") + ::strerror(errno));
    }
    if (pid == 0) {
        ::setpgid(0, 0);
        ::signal(SIGPIPE, SIG_DFL);
        if (::dup2(in.fds[0], STDIN_FILENO) < 0 || ::dup2(out.fds[1], STDOUT_FILENO) < 0 ||
            ::dup2(err.fds[1], STDERR_FILENO) < 0) {
            int e = errno;
            (void)!::write(status.fds[1], &e, sizeof(e));
            ::_exit(127);
        }
        ::execve(exePath.c_str(), argv.data(), envp.data());
        int e = errno;
        (void)!::write(status.fds[1], &e, sizeof(e));
        ::_exit(127);
    }

    // Parent: mirror setpgid to close the race with an early kill
    ::setpgid(pid, pid);
    closeFd(status.fds[1]);
    int childErrno = 0;
    ssize_t n;
    do {
        n = ::read(status.fds[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int st = 0;
        while (::waitpid(pid, &st, 0) < 0 && errno == EINTR) {}
        throw std::runtime_error("exec '" + exePath + "' failed: " + ::strerror(childErrno));
    }

    auto child = std::unique_ptr<ChildProcess>(new ChildProcess(pid, in.release(1), out.release(0), err.release(0)));
    LOG_INFO("ChildProcess: spawned '{}' (pid={})", exePath, static_cast<int>(pid));
    return child;
}

void ChildProcess::CloseStdin() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeFd(stdinFd_);
}

bool ChildProcess::reapLocked(int options) {
    if (exitStatus_.has_value()) {
        return true;
    }
    int st = 0;
    pid_t r;
    do {
        r = ::waitpid(pid_, &st, options);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
        exitStatus_ = st;
        if (WIFEXITED(st)) {
            LOG_DEBUG("ChildProcess: pid {} exited with code {}", static_cast<int>(pid_), WEXITSTATUS(st));
        } else if (WIFSIGNALED(st)) {
            LOG_DEBUG("ChildProcess: pid {} killed by signal {}", static_cast<int>(pid_), WTERMSIG(st));
        }
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere (e.g. a SIGCHLD handler in the embedding application)
        exitStatus_ = 0;
        return true;
    }
    return false;
}

bool ChildProcess::IsAlive() {
    std::lock_guard<std::mutex> lock(mutex_);
    return !reapLocked(WNOHANG);
}

std::optional<int> ChildProcess::ExitStatus() {
    std::lock_guard<std::mutex> lock(mutex_);
    (void)reapLocked(WNOHANG);
    return exitStatus_;
}

void ChildProcess::signalGroup(int sig) {
    if (::kill(-pid_, sig) != 0) {
        if (::kill(pid_, sig) != 0 && errno != ESRCH) {
            LOG_WARN("ChildProcess: kill(pid={}, sig={}) failed (errno={} msg={})",
                     static_cast<int>(pid_), sig, errno, ::strerror(errno));
        }
    }
}

bool ChildProcess::Terminate(std::chrono::milliseconds grace) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(mutex_);
    if (reapLocked(WNOHANG)) {
        return true;
    }
    signalGroup(SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        if (reapLocked(WNOHANG)) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    LOG_WARN("ChildProcess: pid {} ignored SIGTERM for {} ms; sending SIGKILL",
             static_cast<int>(pid_), static_cast<long long>(grace.count()));
    signalGroup(SIGKILL);
    if (reapLocked(0)) {
        return true;
    }
    LOG_ERROR("ChildProcess: failed to reap pid {} (errno={} msg={})", static_cast<int>(pid_), errno, ::strerror(errno));
    return false;
}

} // namespace toolhost
