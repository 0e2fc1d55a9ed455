//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ChildProcess.hpp
// Purpose: POSIX subprocess with piped stdin/stdout/stderr, liveness polling and graceful termination
//==========================================================================================================
#pragma once

#include <sys/types.h>

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolhost {

//==========================================================================================================
// ChildProcess
// Purpose: Owns one spawned process and the parent ends of its three pipes. The child runs in its own
//          process group so Terminate() also reaches grandchildren started by wrapper scripts.
//          The destructor terminates a still-running child (short grace) and closes all descriptors.
//==========================================================================================================
class ChildProcess {
public:
    //======================================================================================================
    // Spawn
    // Purpose: fork/execve command with args; env entries are merged over the inherited environment.
    // Throws:
    //   std::runtime_error when pipes cannot be created, fork fails, or execve fails in the child
    //   (reported back through a close-on-exec status pipe).
    //======================================================================================================
    static std::unique_ptr<ChildProcess> Spawn(const std::string& command,
                                               const std::vector<std::string>& args,
                                               const std::map<std::string, std::string>& env);

    //======================================================================================================
    // ResolveExecutable
    // Purpose: Looks command up on PATH (or in pathEnv when given). Commands containing '/' are checked
    //          directly.
    // Returns:
    //   Absolute or relative path of an executable file, or an empty string when not found.
    //======================================================================================================
    static std::string ResolveExecutable(const std::string& command,
                                         const std::optional<std::string>& pathEnv = std::nullopt);

    ~ChildProcess();
    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    pid_t Pid() const { return pid_; }
    int StdinFd() const { return stdinFd_; }
    int StdoutFd() const { return stdoutFd_; }
    int StderrFd() const { return stderrFd_; }

    // Closes the write end of the child's stdin (the child sees EOF).
    void CloseStdin();

    // Non-blocking; reaps the child when it has exited.
    bool IsAlive();

    // Raw wait status once reaped.
    std::optional<int> ExitStatus();

    //======================================================================================================
    // Terminate
    // Purpose: SIGTERM, wait up to grace, then SIGKILL and wait again.
    // Returns:
    //   true when the child has been reaped; false when it could not be reaped (logged).
    //======================================================================================================
    bool Terminate(std::chrono::milliseconds grace);

private:
    ChildProcess(pid_t pid, int stdinFd, int stdoutFd, int stderrFd);
    bool reapLocked(int options);
    void signalGroup(int sig);

    pid_t pid_;
    int stdinFd_;
    int stdoutFd_;
    int stderrFd_;
    std::mutex mutex_;
    std::optional<int> exitStatus_;
};

} // namespace toolhost
