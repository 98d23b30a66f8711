#pragma once

#include <memory>
#include <string>
#include <vector>

struct SystemSummary {
    std::string os;
    std::string os_release;
    double cpu_usage_percent = 0.0;
    double memory_used_gb = 0.0;
    double memory_total_gb = 0.0;
    bool valid = false;
};

struct ImageFiles {
    std::vector<std::string> files;
    int count = 0;
    std::string directory;
    bool valid = false;
};

/// Read-only client for the backend's HTTP routes. The supervisor itself
/// never calls it; `nasmon status` does.
class BackendClient {
public:
    BackendClient(const std::string& host, int port, int timeout_sec = 3);
    ~BackendClient();

    /// GET /system-info answers 200
    bool test_connection();

    SystemSummary get_system_info();
    ImageFiles get_image_files();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};
