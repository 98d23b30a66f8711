#include "daemon/port_probe.hpp"

#include <spdlog/spdlog.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace {
constexpr const char* TCP_LISTEN_STATE = "0A";
}

bool PortProbe::scan_listen_table(const std::string& table_path, uint16_t port, bool& found) {
    std::ifstream in(table_path);
    if (!in.is_open()) return false;

    found = false;
    std::string line;
    std::getline(in, line);  // header
    while (std::getline(in, line)) {
        std::istringstream iss(line);
        std::string slot, local, remote, state;
        if (!(iss >> slot >> local >> remote >> state)) continue;
        if (state != TCP_LISTEN_STATE) continue;

        auto colon = local.rfind(':');
        if (colon == std::string::npos) continue;
        unsigned long local_port = 0;
        try {
            local_port = std::stoul(local.substr(colon + 1), nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }
        if (local_port == port) {
            found = true;
            return true;
        }
    }
    return true;
}

PortProbe::ConnectResult PortProbe::try_connect(uint16_t port, int timeout_ms) {
    int fd = socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (fd < 0) return ConnectResult::Unknown;

    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    ConnectResult result = ConnectResult::Unknown;
    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) == 0) {
        result = ConnectResult::Accepted;
    } else if (errno == ECONNREFUSED) {
        result = ConnectResult::Refused;
    } else if (errno == EINPROGRESS) {
        struct pollfd pfd;
        pfd.fd = fd;
        pfd.events = POLLOUT;
        if (poll(&pfd, 1, timeout_ms) == 1) {
            int err = 0;
            socklen_t len = sizeof(err);
            if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len) == 0) {
                if (err == 0) result = ConnectResult::Accepted;
                else if (err == ECONNREFUSED) result = ConnectResult::Refused;
            }
        }
    }
    close(fd);
    return result;
}

PortStatus PortProbe::probe(uint16_t port) {
    PortStatus status;
    status.port = port;

    bool readable = false;
    for (const char* table : {"/proc/net/tcp", "/proc/net/tcp6"}) {
        bool found = false;
        if (scan_listen_table(table, port, found)) {
            readable = true;
            if (found) {
                status.occupied = true;
                return status;
            }
        }
    }
    if (readable) return status;

    switch (try_connect(port)) {
        case ConnectResult::Accepted:
            status.occupied = true;
            break;
        case ConnectResult::Refused:
            break;
        case ConnectResult::Unknown:
            status.known = false;
            spdlog::warn("[Probe] Cannot determine whether port {} is in use, assuming free", port);
            break;
    }
    return status;
}

bool PortProbe::is_occupied(uint16_t port) {
    return probe(port).occupied;
}
