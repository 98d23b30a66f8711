#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>

struct SpawnResult {
    bool success = false;
    pid_t pid = -1;
    std::string error;
};

/// Start, probe and stop child processes.
class ProcessHandle {
public:
    /// Launch command with args. stdout/stderr are appended to log_path
    /// (created with parent directories if absent), stdin is /dev/null and the
    /// child gets its own process group. Returns once exec has succeeded;
    /// does not wait for the child to become ready.
    static SpawnResult spawn(const std::string& command,
                             const std::vector<std::string>& args,
                             const std::string& log_path,
                             const std::string& working_dir = "");

    /// Non-destructive liveness check. Reaps the process if it is our child and
    /// has exited; exit_code receives its status (signal number negated).
    static bool is_alive(pid_t pid, int* exit_code = nullptr);

    /// SIGTERM, wait up to grace, then SIGKILL. No-op if pid is not alive.
    /// With group set, pid must lead its own process group (true for
    /// everything spawn() started): the whole group is signalled and waited
    /// for, so grandchildren cannot outlive it. Otherwise only pid is touched.
    /// Returns true if SIGKILL was needed.
    static bool terminate(pid_t pid,
                          std::chrono::milliseconds grace = std::chrono::milliseconds(1000),
                          bool group = false);

    /// argv of a running process from /proc (empty if unreadable)
    static std::vector<std::string> read_cmdline(pid_t pid);

private:
    /// Any member of process group pgid still running (zombies excluded)
    static bool group_alive(pid_t pgid);
    static bool wait_gone(pid_t pid, std::chrono::milliseconds timeout, bool group);
    static void send_signal(pid_t pid, int sig, bool group);
};
