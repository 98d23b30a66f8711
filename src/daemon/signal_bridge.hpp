#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <initializer_list>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <signal.h>

/// One-shot shutdown notification. Any thread may request; the supervisor
/// thread waits on it. Only the first request counts.
class ShutdownToken {
public:
    /// Returns true for the request that actually triggered shutdown
    bool request(const std::string& reason);

    bool requested() const;
    std::string reason() const;

    /// Sleep up to timeout, waking early on request. True if requested.
    bool wait_for(std::chrono::milliseconds timeout) const;

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    bool requested_ = false;
    std::string reason_;
};

/// Turns SIGINT/SIGTERM into a single ShutdownToken request. The handler only
/// writes to a self-pipe; a watcher thread does the rest. One bridge may be
/// installed per process.
class SignalBridge {
public:
    explicit SignalBridge(ShutdownToken& token);
    ~SignalBridge();

    SignalBridge(const SignalBridge&) = delete;
    SignalBridge& operator=(const SignalBridge&) = delete;

    bool install(std::initializer_list<int> signals = {SIGINT, SIGTERM});
    void uninstall();

    /// Signals seen so far, including the absorbed duplicates
    int signals_received() const { return received_.load(); }

private:
    ShutdownToken& token_;
    int pipe_[2] = {-1, -1};
    std::atomic<bool> stop_{false};
    std::atomic<int> received_{0};
    std::thread watcher_;
    std::vector<std::pair<int, struct sigaction>> previous_;

    static void handle_signal(int sig);
    void watch_loop();
};
