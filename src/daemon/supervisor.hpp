#pragma once

#include "core/config.hpp"
#include "core/errors.hpp"
#include "daemon/conflict_resolver.hpp"

#include <atomic>
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

class ProcessRegistry;
class RuntimeEnvironment;
class ShutdownToken;

enum class ServiceRole { Backend, Frontend };

enum class ProcessState { NotStarted, Starting, Running, Stopping, Stopped };

enum class SupervisorState {
    Idle,
    StartingBackend,
    BackendReady,
    StartingFrontend,
    FrontendReady,
    Running,
    ShuttingDown,
    Stopped
};

const char* role_name(ServiceRole role);
const char* state_name(SupervisorState state);

/// How to launch one child
struct ServiceSpec {
    ServiceRole role = ServiceRole::Backend;
    std::string command;
    std::vector<std::string> args;
    std::string working_dir;
    std::string log_path;
    uint16_t port = 0;
    ProcessSignature signature;  // identifies stale instances of this child
};

struct ManagedProcess {
    ServiceRole role = ServiceRole::Backend;
    std::optional<pid_t> pid;  // set only once spawn is confirmed
    ProcessState state = ProcessState::NotStarted;
    std::string log_path;
};

/// Starts the backend then the frontend, watches both, and tears everything
/// down exactly once. All state is owned by the thread calling run().
class Supervisor {
public:
    Supervisor(ServiceSpec backend, ServiceSpec frontend, TimingPolicy timing,
               ShutdownToken& shutdown,
               ProcessRegistry* registry = nullptr,
               RuntimeEnvironment* environment = nullptr);
    ~Supervisor();

    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;

    /// start() + monitor() + shutdown(). Returns the process exit status.
    int run();

    /// Idle → Running. On failure everything already started is stopped
    /// and error() describes why.
    bool start();

    /// Block in Running until shutdown is requested or a child dies
    void monitor();

    /// Stop every child not yet Stopped and release the environment.
    /// Later calls are no-ops.
    void shutdown();

    SupervisorState state() const { return state_.load(); }
    const ManagedProcess& process(ServiceRole role) const;
    const SupervisorError& error() const { return error_; }
    bool child_exited() const { return child_exited_; }

    /// Observers, called on the supervisor thread
    std::function<void(SupervisorState)> on_state_change;
    std::function<void(ServiceRole, pid_t)> on_terminate;

private:
    ServiceSpec specs_[2];
    ManagedProcess procs_[2];
    TimingPolicy timing_;
    ShutdownToken& shutdown_;
    ProcessRegistry* registry_;
    RuntimeEnvironment* environment_;
    ConflictResolver resolver_;

    std::atomic<SupervisorState> state_{SupervisorState::Idle};
    SupervisorError error_;
    bool child_exited_ = false;

    void transition(SupervisorState next);
    void fail(ErrorKind kind, const std::string& message, uint16_t port = 0);

    /// ensure_free + spawn + settle + liveness check for one role
    bool start_service(ServiceRole role);
    void stop_service(ServiceRole role);
    void persist_registry();

    ManagedProcess& proc(ServiceRole role) { return procs_[static_cast<int>(role)]; }
    const ServiceSpec& spec(ServiceRole role) const { return specs_[static_cast<int>(role)]; }
};
