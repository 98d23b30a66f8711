#pragma once

#include <cstdint>
#include <string>
#include <vector>

struct TimingPolicy {
    int port_settle_ms = 2000;      // wait after remediation before re-probing
    int start_settle_ms = 3000;     // wait after spawn before the liveness check
    int terminate_grace_ms = 1000;  // SIGTERM → SIGKILL window
    int poll_interval_ms = 5000;    // monitoring loop period
};

struct AppConfig {
    // Required
    uint16_t frontend_port = 0;
    uint16_t backend_port = 0;

    // Runtime environment
    std::string python = "python3";
    std::string venv_dir = "venv";
    std::vector<std::string> dependencies = {"psutil", "fastapi", "uvicorn"};
    bool install_missing_dependencies = true;

    // Children
    std::string backend_script = "system_info.py";
    std::string frontend_index = "index.html";

    // Paths
    std::string logs_dir = "logs";
    std::string run_dir = "run";

    std::string log_level = "info";

    TimingPolicy timing;
};

class Config {
public:
    Config();
    ~Config();

    struct LoadResult { bool success; std::string error; };

    /// Load and validate config.json from the project directory
    LoadResult load();
    /// Load and validate a specific file
    LoadResult load(const std::string& path);

    AppConfig& data();
    const AppConfig& data() const;

    /// Resolve a configured path against the directory holding config.json
    std::string resolve(const std::string& path) const;
    const std::string& base_dir() const { return base_dir_; }

    std::string backend_log_path() const;
    std::string frontend_log_path() const;
    std::string supervisor_log_path() const;
    std::string state_path() const;

    /// $NASMON_HOME, or the current working directory
    static std::string project_dir();
    static std::string config_path();

private:
    AppConfig config_;
    std::string base_dir_;
};
