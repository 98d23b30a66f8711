#pragma once

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <functional>
#include <string>
#include <thread>
#include <utility>

#ifndef FAKE_SERVICE_PATH
#define FAKE_SERVICE_PATH "fake_service"
#endif

namespace test_helpers {

/// A port nothing listens on right now (kernel-assigned, then released)
inline uint16_t find_free_port() {
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
    addr.sin_port = 0;
    bind(fd, (struct sockaddr*)&addr, sizeof(addr));
    socklen_t len = sizeof(addr);
    getsockname(fd, (struct sockaddr*)&addr, &len);
    close(fd);
    return ntohs(addr.sin_port);
}

/// Two ports that are free and differ from each other
inline std::pair<uint16_t, uint16_t> find_free_port_pair() {
    uint16_t first = find_free_port();
    uint16_t second = find_free_port();
    while (second == first) second = find_free_port();
    return {first, second};
}

/// Listener held by the test process itself: a "foreign" port owner that no
/// signature matches
class ScopedListener {
public:
    explicit ScopedListener(uint16_t port) {
        fd_ = socket(AF_INET, SOCK_STREAM, 0);
        int one = 1;
        setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        struct sockaddr_in addr;
        std::memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_ANY);
        addr.sin_port = htons(port);
        ok_ = bind(fd_, (struct sockaddr*)&addr, sizeof(addr)) == 0 && listen(fd_, 4) == 0;
    }
    ~ScopedListener() {
        if (fd_ >= 0) close(fd_);
    }
    bool ok() const { return ok_; }

private:
    int fd_ = -1;
    bool ok_ = false;
};

inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return pred();
}

}  // namespace test_helpers
