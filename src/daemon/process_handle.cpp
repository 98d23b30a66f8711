#include "daemon/process_handle.hpp"

#include <spdlog/spdlog.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <thread>

namespace fs = std::filesystem;

SpawnResult ProcessHandle::spawn(const std::string& command,
                                 const std::vector<std::string>& args,
                                 const std::string& log_path,
                                 const std::string& working_dir) {
    SpawnResult result;

    try {
        auto parent = fs::path(log_path).parent_path();
        if (!parent.empty()) fs::create_directories(parent);
    } catch (const fs::filesystem_error& e) {
        result.error = "cannot create log directory for " + log_path + ": " + e.what();
        return result;
    }

    int log_fd = open(log_path.c_str(), O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC, 0644);
    if (log_fd < 0) {
        result.error = "cannot open log " + log_path + ": " + std::strerror(errno);
        return result;
    }

    // Carries errno back from the child if chdir/exec fails; closes on exec
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) < 0) {
        result.error = std::string("pipe2 failed: ") + std::strerror(errno);
        close(log_fd);
        return result;
    }

    // Build argv before fork so the child does not allocate
    std::vector<const char*> argv;
    argv.push_back(command.c_str());
    for (const auto& arg : args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        close(log_fd);
        close(err_pipe[0]);
        close(err_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        close(err_pipe[0]);

        // Own process group: a terminal Ctrl+C reaches only the supervisor
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(log_fd, STDOUT_FILENO);
        dup2(log_fd, STDERR_FILENO);

        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        int child_errno = 0;
        if (!working_dir.empty() && chdir(working_dir.c_str()) != 0) {
            child_errno = errno;
        } else {
            execvp(argv[0], const_cast<char* const*>(argv.data()));
            child_errno = errno;
        }
        ssize_t ignored = write(err_pipe[1], &child_errno, sizeof(child_errno));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(log_fd);
    close(err_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n > 0) {
        int status;
        waitpid(pid, &status, 0);
        result.error = "cannot start " + command + ": " + std::strerror(child_errno);
        return result;
    }

    spdlog::debug("[Process] Started {} (PID {}), output -> {}", command, pid, log_path);
    result.success = true;
    result.pid = pid;
    return result;
}

std::vector<std::string> ProcessHandle::read_cmdline(pid_t pid) {
    std::vector<std::string> argv;
    std::ifstream in("/proc/" + std::to_string(pid) + "/cmdline", std::ios::binary);
    if (!in.is_open()) return argv;

    std::string raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    std::string current;
    for (char c : raw) {
        if (c == '\0') {
            argv.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) argv.push_back(current);
    return argv;
}

// State letter and process group from /proc/<pid>/stat ("pid (comm) S ppid pgrp ...")
static bool read_stat(pid_t pid, char& state, pid_t& pgrp) {
    std::ifstream in("/proc/" + std::to_string(pid) + "/stat");
    std::string line;
    if (!in.is_open() || !std::getline(in, line)) return false;
    auto paren = line.rfind(')');
    if (paren == std::string::npos || paren + 2 >= line.size()) return false;
    std::istringstream rest(line.substr(paren + 2));
    long ppid = 0;
    long group = 0;
    if (!(rest >> state >> ppid >> group)) return false;
    pgrp = static_cast<pid_t>(group);
    return true;
}

static bool is_zombie(pid_t pid) {
    char state = 0;
    pid_t pgrp = 0;
    return read_stat(pid, state, pgrp) && state == 'Z';
}

bool ProcessHandle::is_alive(pid_t pid, int* exit_code) {
    if (pid <= 0) return false;

    int status = 0;
    pid_t result = waitpid(pid, &status, WNOHANG);
    if (result == pid) {
        if (exit_code) {
            if (WIFEXITED(status)) *exit_code = WEXITSTATUS(status);
            else if (WIFSIGNALED(status)) *exit_code = -WTERMSIG(status);
            else *exit_code = -1;
        }
        return false;
    }
    if (result == 0) {
        return true;  // our child, still running
    }

    // Not our child (or already reaped): probe without sending a signal
    if (kill(pid, 0) == 0) {
        return !is_zombie(pid);
    }
    return errno == EPERM;
}

bool ProcessHandle::group_alive(pid_t pgid) {
    if (pgid <= 0) return false;
    if (kill(-pgid, 0) != 0) return errno == EPERM;

    // kill() also succeeds for zombies nobody has reaped yet
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator("/proc", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(),
                                         [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        char state = 0;
        pid_t pgrp = 0;
        if (read_stat(static_cast<pid_t>(std::stol(name)), state, pgrp) &&
            pgrp == pgid && state != 'Z') {
            return true;
        }
    }
    return false;
}

void ProcessHandle::send_signal(pid_t pid, int sig, bool group) {
    if (group && kill(-pid, sig) == 0) return;
    if (kill(pid, sig) != 0 && errno != ESRCH) {
        spdlog::warn("[Process] kill({}, {}) failed: {}", pid, sig, std::strerror(errno));
    }
}

bool ProcessHandle::wait_gone(pid_t pid, std::chrono::milliseconds timeout, bool group) {
    using clock = std::chrono::steady_clock;
    auto deadline = clock::now() + timeout;
    while (true) {
        // Leader first: reaping it is what lets the group check see it gone
        bool leader = is_alive(pid);
        if (!leader && !(group && group_alive(pid))) return true;
        auto now = clock::now();
        if (now >= deadline) return false;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, std::chrono::milliseconds(100)));
    }
}

bool ProcessHandle::terminate(pid_t pid, std::chrono::milliseconds grace, bool group) {
    if (pid <= 0) return false;
    if (!is_alive(pid) && !(group && group_alive(pid))) return false;

    send_signal(pid, SIGTERM, group);
    if (wait_gone(pid, grace, group)) {
        spdlog::debug("[Process] PID {} exited after SIGTERM", pid);
        return false;
    }

    spdlog::warn("[Process] PID {}{} still running after {} ms, sending SIGKILL",
                 pid, group ? " (or its process group)" : "", grace.count());
    send_signal(pid, SIGKILL, group);
    if (!wait_gone(pid, std::chrono::milliseconds(2000), group)) {
        spdlog::error("[Process] PID {} survived SIGKILL", pid);
    }
    return true;
}
