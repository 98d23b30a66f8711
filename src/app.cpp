#include "app.hpp"
#include "core/config.hpp"
#include "core/environment.hpp"
#include "core/logging.hpp"
#include "daemon/process_handle.hpp"
#include "daemon/process_registry.hpp"
#include "daemon/signal_bridge.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <unistd.h>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

namespace fs = std::filesystem;

App::App() = default;
App::~App() = default;

ServiceSpec App::backend_spec(const Config& config, const std::string& interpreter) {
    const auto& d = config.data();
    const std::string script = config.resolve(d.backend_script);
    const std::string port = std::to_string(d.backend_port);

    ServiceSpec spec;
    spec.role = ServiceRole::Backend;
    spec.command = interpreter;
    spec.args = {script, "--serve", "--port", port};
    spec.working_dir = config.base_dir();
    spec.log_path = config.backend_log_path();
    spec.port = d.backend_port;
    spec.signature.role = role_name(ServiceRole::Backend);
    spec.signature.tokens = {fs::path(script).filename().string(), "--serve", "--port", port};
    return spec;
}

ServiceSpec App::frontend_spec(const Config& config, const std::string& interpreter) {
    const auto& d = config.data();
    const std::string port = std::to_string(d.frontend_port);

    ServiceSpec spec;
    spec.role = ServiceRole::Frontend;
    spec.command = interpreter;
    spec.args = {"-m", "http.server", port};
    // http.server serves its working directory, so run it next to index.html
    spec.working_dir = fs::path(config.resolve(d.frontend_index)).parent_path().string();
    spec.log_path = config.frontend_log_path();
    spec.port = d.frontend_port;
    spec.signature.role = role_name(ServiceRole::Frontend);
    spec.signature.tokens = {"http.server", port};
    return spec;
}

SupervisorError App::prepare_environment(const Config& config, RuntimeEnvironment& env) {
    const auto& d = config.data();
    SupervisorError err;

    auto created = env.ensure_created();
    if (!created.success) {
        err.kind = ErrorKind::Environment;
        err.message = created.error;
        return err;
    }

    auto files = RuntimeEnvironment::check_files({config.resolve(d.backend_script),
                                                  config.resolve(d.frontend_index)});
    if (!files.success) {
        err.kind = ErrorKind::Dependency;
        err.message = files.error;
        return err;
    }

    auto deps = env.ensure_dependencies(d.dependencies, d.install_missing_dependencies);
    if (!deps.success) {
        err.kind = ErrorKind::Dependency;
        err.message = deps.error;
        return err;
    }
    return err;
}

int App::run() {
    // 1. Configuration
    Config config;
    auto loaded = config.load();
    if (!loaded.success) {
        spdlog::error("[Config] {}: {}", error_kind_name(ErrorKind::Config), loaded.error);
        return exit_code_for(ErrorKind::Config);
    }
    const auto& d = config.data();

    setup_logging(d.log_level, config.supervisor_log_path());
    spdlog::info("=== nasmon {} ===", APP_VERSION);
    spdlog::info("Project directory: {}", config.base_dir());
    spdlog::info("Ports: frontend {}, backend {}", d.frontend_port, d.backend_port);

    // 2. Isolated runtime + dependencies
    RuntimeEnvironment env(config.resolve(d.venv_dir), d.python);
    auto prepared = prepare_environment(config, env);
    if (prepared) {
        spdlog::error("[Env] {}: {}", error_kind_name(prepared.kind), prepared.message);
        return exit_code_for(prepared.kind);
    }
    env.activate();

    // 3. Registry of what previous runs left behind
    ProcessRegistry registry(config.state_path());
    if (!registry.load()) {
        spdlog::warn("[Supervisor] Starting with an empty process registry");
    }
    pid_t previous = registry.supervisor_pid();
    if (previous > 0 && previous != getpid() && ProcessHandle::is_alive(previous)) {
        spdlog::warn("[Supervisor] Another supervisor (PID {}) appears to be running; "
                     "its children will be treated as stale", previous);
    }

    // 4. Signals → shutdown token
    ShutdownToken shutdown;
    SignalBridge bridge(shutdown);
    if (!bridge.install()) {
        spdlog::error("[Signal] Cannot install SIGINT/SIGTERM handlers");
        env.deactivate();
        return 1;
    }

    // 5. Children
    Supervisor supervisor(backend_spec(config, env.interpreter()),
                          frontend_spec(config, env.interpreter()),
                          d.timing, shutdown, &registry, &env);
    int rc = supervisor.run();
    spdlog::info("[Supervisor] Stopped (exit status {})", rc);
    return rc;
}
