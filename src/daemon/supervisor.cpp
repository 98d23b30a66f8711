#include "daemon/supervisor.hpp"
#include "core/environment.hpp"
#include "daemon/process_handle.hpp"
#include "daemon/process_registry.hpp"
#include "daemon/signal_bridge.hpp"

#include <spdlog/spdlog.h>
#include <chrono>
#include <unistd.h>

using std::chrono::milliseconds;

const char* role_name(ServiceRole role) {
    return role == ServiceRole::Backend ? "backend" : "frontend";
}

const char* state_name(SupervisorState state) {
    switch (state) {
        case SupervisorState::Idle:             return "Idle";
        case SupervisorState::StartingBackend:  return "StartingBackend";
        case SupervisorState::BackendReady:     return "BackendReady";
        case SupervisorState::StartingFrontend: return "StartingFrontend";
        case SupervisorState::FrontendReady:    return "FrontendReady";
        case SupervisorState::Running:          return "Running";
        case SupervisorState::ShuttingDown:     return "ShuttingDown";
        case SupervisorState::Stopped:          return "Stopped";
    }
    return "Unknown";
}

Supervisor::Supervisor(ServiceSpec backend, ServiceSpec frontend, TimingPolicy timing,
                       ShutdownToken& shutdown,
                       ProcessRegistry* registry,
                       RuntimeEnvironment* environment)
    : specs_{std::move(backend), std::move(frontend)},
      timing_(timing),
      shutdown_(shutdown),
      registry_(registry),
      environment_(environment),
      resolver_(milliseconds(timing.port_settle_ms),
                milliseconds(timing.terminate_grace_ms),
                registry) {
    for (auto role : {ServiceRole::Backend, ServiceRole::Frontend}) {
        auto& s = specs_[static_cast<int>(role)];
        s.role = role;
        if (s.signature.role.empty()) s.signature.role = role_name(role);

        auto& p = proc(role);
        p.role = role;
        p.log_path = s.log_path;
    }
}

Supervisor::~Supervisor() {
    shutdown();
}

const ManagedProcess& Supervisor::process(ServiceRole role) const {
    return procs_[static_cast<int>(role)];
}

void Supervisor::transition(SupervisorState next) {
    spdlog::debug("[Supervisor] {} -> {}", state_name(state_.load()), state_name(next));
    state_.store(next);
    if (on_state_change) on_state_change(next);
}

void Supervisor::fail(ErrorKind kind, const std::string& message, uint16_t port) {
    if (!error_) {
        error_.kind = kind;
        error_.message = message;
        error_.port = port;
    }
    spdlog::error("[Supervisor] {}: {}", error_kind_name(kind), message);
}

void Supervisor::persist_registry() {
    if (registry_ && !registry_->save()) {
        spdlog::warn("[Supervisor] Could not update {}", registry_->state_path());
    }
}

bool Supervisor::start_service(ServiceRole role) {
    const ServiceSpec& s = spec(role);
    ManagedProcess& p = proc(role);

    auto freed = resolver_.ensure_free(s.port, s.signature);
    if (!freed.success) {
        fail(ErrorKind::PortConflict, freed.error, s.port);
        return false;
    }
    if (shutdown_.requested()) return false;

    transition(role == ServiceRole::Backend ? SupervisorState::StartingBackend
                                            : SupervisorState::StartingFrontend);
    p.state = ProcessState::Starting;
    spdlog::info("[Supervisor] Starting {} on port {}", role_name(role), s.port);

    auto spawned = ProcessHandle::spawn(s.command, s.args, s.log_path, s.working_dir);
    if (!spawned.success) {
        p.state = ProcessState::Stopped;
        fail(ErrorKind::Spawn, std::string(role_name(role)) + ": " + spawned.error);
        return false;
    }
    p.pid = spawned.pid;
    spdlog::info("[Supervisor] {} started (PID {}), log: {}", role_name(role), spawned.pid, s.log_path);

    if (registry_) {
        registry_->record(role_name(role), spawned.pid, s.port, s.log_path);
        persist_registry();
    }

    // Shutdown during the settle window: stop here, teardown follows
    if (shutdown_.wait_for(milliseconds(timing_.start_settle_ms))) {
        return false;
    }

    int exit_code = -1;
    if (!ProcessHandle::is_alive(spawned.pid, &exit_code)) {
        p.state = ProcessState::Stopped;
        fail(ErrorKind::EarlyExit,
             std::string(role_name(role)) + " exited during startup (status " +
                 std::to_string(exit_code) + "), check " + s.log_path);
        return false;
    }

    p.state = ProcessState::Running;
    transition(role == ServiceRole::Backend ? SupervisorState::BackendReady
                                            : SupervisorState::FrontendReady);
    return true;
}

bool Supervisor::start() {
    if (state_.load() != SupervisorState::Idle) {
        return state_.load() == SupervisorState::Running;
    }

    if (registry_) {
        registry_->set_supervisor_pid(getpid());
        persist_registry();
    }

    if (!start_service(ServiceRole::Backend) || !start_service(ServiceRole::Frontend)) {
        if (!error_ && shutdown_.requested()) {
            spdlog::info("[Supervisor] Shutdown requested during startup ({})", shutdown_.reason());
        }
        shutdown();
        return false;
    }

    transition(SupervisorState::Running);
    return true;
}

void Supervisor::monitor() {
    if (state_.load() != SupervisorState::Running) return;

    const milliseconds interval(timing_.poll_interval_ms);
    while (!shutdown_.wait_for(interval)) {
        for (auto role : {ServiceRole::Backend, ServiceRole::Frontend}) {
            ManagedProcess& p = proc(role);
            if (p.state != ProcessState::Running || !p.pid) continue;

            int exit_code = -1;
            if (!ProcessHandle::is_alive(*p.pid, &exit_code)) {
                p.state = ProcessState::Stopped;
                child_exited_ = true;
                spdlog::warn("[Supervisor] {} (PID {}) stopped unexpectedly (status {}), check {}",
                             role_name(role), *p.pid, exit_code, p.log_path);
            }
        }
        if (child_exited_) return;
    }
    spdlog::info("[Supervisor] Shutdown requested: {}", shutdown_.reason());
}

void Supervisor::stop_service(ServiceRole role) {
    ManagedProcess& p = proc(role);
    if (p.state == ProcessState::NotStarted || p.state == ProcessState::Stopped || !p.pid) {
        if (registry_) registry_->clear(role_name(role));
        return;
    }

    p.state = ProcessState::Stopping;
    if (on_terminate) on_terminate(role, *p.pid);

    // Spawned children lead their own group; take grandchildren (uvicorn workers) down too
    bool forced = ProcessHandle::terminate(*p.pid, milliseconds(timing_.terminate_grace_ms),
                                           /*group=*/true);
    p.state = ProcessState::Stopped;
    spdlog::info("[Supervisor] Stopped {} (PID {}){}", role_name(role), *p.pid,
                 forced ? " after SIGKILL" : "");

    if (registry_) registry_->clear(role_name(role));
}

void Supervisor::shutdown() {
    auto current = state_.load();
    if (current == SupervisorState::ShuttingDown || current == SupervisorState::Stopped) {
        return;
    }
    transition(SupervisorState::ShuttingDown);

    stop_service(ServiceRole::Backend);
    stop_service(ServiceRole::Frontend);

    if (environment_) {
        environment_->deactivate();
    }
    if (registry_) {
        registry_->clear_all();
        persist_registry();
    }

    transition(SupervisorState::Stopped);
}

int Supervisor::run() {
    if (!start()) {
        if (error_) return exit_code_for(error_.kind);
        return 0;
    }

    const auto& be = spec(ServiceRole::Backend);
    const auto& fe = spec(ServiceRole::Frontend);
    spdlog::info("[Supervisor] Services running");
    spdlog::info("[Supervisor]   frontend: http://localhost:{}", fe.port);
    spdlog::info("[Supervisor]   API:      http://localhost:{}/system-info", be.port);
    spdlog::info("[Supervisor]   images:   http://localhost:{}/image-files", be.port);
    spdlog::info("[Supervisor]   logs:     {}, {}", be.log_path, fe.log_path);
    spdlog::info("[Supervisor] Press Ctrl+C to stop");

    monitor();
    shutdown();
    return child_exited_ ? EXIT_CHILD_EXITED : 0;
}
