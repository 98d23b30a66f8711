#pragma once

#include "daemon/supervisor.hpp"

#include <string>

class Config;
class RuntimeEnvironment;

/// Foreground supervisor run: config → environment → children → monitor.
class App {
public:
    App();
    ~App();

    /// Returns the process exit status
    int run();

    /// Launch descriptions for both children from the loaded config
    static ServiceSpec backend_spec(const Config& config, const std::string& interpreter);
    static ServiceSpec frontend_spec(const Config& config, const std::string& interpreter);

    /// Bootstrap the isolated runtime: create/reuse, required files, packages.
    /// Returns ErrorKind::None when the children can be launched.
    static SupervisorError prepare_environment(const Config& config, RuntimeEnvironment& env);
};
