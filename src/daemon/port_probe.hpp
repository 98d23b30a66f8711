#pragma once

#include <cstdint>
#include <string>

struct PortStatus {
    uint16_t port = 0;
    bool occupied = false;
    bool known = true;  // false when neither probe method could decide
};

/// Checks whether a TCP port has a listener on this host. Never binds.
class PortProbe {
public:
    /// Recomputed on every call; unknown status is reported as free
    static PortStatus probe(uint16_t port);
    static bool is_occupied(uint16_t port);

    /// Scan one /proc/net/tcp-format table for a LISTEN entry on port.
    /// Returns false if the table cannot be read; found is set otherwise.
    static bool scan_listen_table(const std::string& table_path, uint16_t port, bool& found);

private:
    enum class ConnectResult { Accepted, Refused, Unknown };
    static ConnectResult try_connect(uint16_t port, int timeout_ms = 200);
};
