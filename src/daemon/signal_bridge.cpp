#include "daemon/signal_bridge.hpp"

#include <spdlog/spdlog.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

// ── ShutdownToken ───────────────────────────────────────────

bool ShutdownToken::request(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (requested_) return false;
        requested_ = true;
        reason_ = reason;
    }
    cv_.notify_all();
    return true;
}

bool ShutdownToken::requested() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requested_;
}

std::string ShutdownToken::reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return reason_;
}

bool ShutdownToken::wait_for(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] { return requested_; });
}

// ── SignalBridge ────────────────────────────────────────────

static std::atomic<int> g_signal_write_fd{-1};

void SignalBridge::handle_signal(int sig) {
    int saved_errno = errno;
    int fd = g_signal_write_fd.load();
    if (fd >= 0) {
        unsigned char byte = static_cast<unsigned char>(sig);
        ssize_t ignored = write(fd, &byte, 1);
        (void)ignored;
    }
    errno = saved_errno;
}

SignalBridge::SignalBridge(ShutdownToken& token) : token_(token) {}

SignalBridge::~SignalBridge() {
    uninstall();
}

bool SignalBridge::install(std::initializer_list<int> signals) {
    if (watcher_.joinable()) return true;

    if (pipe2(pipe_, O_CLOEXEC | O_NONBLOCK) < 0) {
        spdlog::error("[Signal] pipe2 failed: {}", std::strerror(errno));
        return false;
    }
    g_signal_write_fd.store(pipe_[1]);

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = &SignalBridge::handle_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;

    for (int sig : signals) {
        struct sigaction old;
        if (sigaction(sig, &sa, &old) < 0) {
            spdlog::error("[Signal] sigaction({}) failed: {}", sig, std::strerror(errno));
            uninstall();
            return false;
        }
        previous_.emplace_back(sig, old);
    }

    stop_.store(false);
    watcher_ = std::thread(&SignalBridge::watch_loop, this);
    return true;
}

void SignalBridge::uninstall() {
    for (auto& [sig, old] : previous_) {
        sigaction(sig, &old, nullptr);
    }
    previous_.clear();

    stop_.store(true);
    if (watcher_.joinable()) {
        watcher_.join();
    }

    g_signal_write_fd.store(-1);
    for (int& fd : pipe_) {
        if (fd >= 0) {
            close(fd);
            fd = -1;
        }
    }
}

void SignalBridge::watch_loop() {
    struct pollfd pfd;
    pfd.fd = pipe_[0];
    pfd.events = POLLIN;

    while (!stop_.load()) {
        int ret = poll(&pfd, 1, 100);
        if (ret <= 0 || !(pfd.revents & POLLIN)) continue;

        unsigned char sigs[16];
        ssize_t n = read(pipe_[0], sigs, sizeof(sigs));
        for (ssize_t i = 0; i < n; ++i) {
            int sig = sigs[i];
            received_.fetch_add(1);
            std::string reason = std::string("received ") + strsignal(sig);
            if (token_.request(reason)) {
                spdlog::info("[Signal] {}, shutting down", reason);
            } else {
                spdlog::info("[Signal] {} while already shutting down, ignored", reason);
            }
        }
    }
}
