#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "api/backend_client.hpp"
#include "daemon/conflict_resolver.hpp"
#include "daemon/port_probe.hpp"
#include "daemon/process_handle.hpp"
#include "daemon/process_registry.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <thread>
#include <signal.h>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) return -1;  // no subcommand → run supervisor

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "start") == 0 || std::strcmp(cmd, "run") == 0) {
        return -1;
    }
    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status();
    }
    if (std::strcmp(cmd, "stop") == 0) {
        return cmd_stop();
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'nasmon help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "nasmon: supervisor for the NAS monitor backend and web front end\n"
        "\n"
        "Usage:\n"
        "  nasmon            Start both services in the foreground (default)\n"
        "  nasmon start      Same as above\n"
        "  nasmon status     Show supervisor, services, ports and API status\n"
        "  nasmon stop       Ask a running supervisor to shut down\n"
        "  nasmon version    Show version\n"
        "  nasmon help       Show this help\n"
        "\n"
        "Configuration is read from config.json in $NASMON_HOME, or the current\n"
        "directory when NASMON_HOME is unset:\n"
        "  { \"frontend_port\": 8000, \"backend_port\": 8001 }\n"
        "\n"
        "Logs: logs/api_server.log, logs/http_server.log, logs/supervisor.log\n"
        "\n"
        "Exit status:\n"
        "  0 clean shutdown    1 service died     2 config error\n"
        "  3 environment       4 dependencies     5 port conflict\n"
        "  6 spawn failure     7 early exit\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "nasmon " << APP_VERSION << "\n";
    return 0;
}

// ── status ──────────────────────────────────────────────────

int CLI::cmd_status() {
    Config config;
    auto loaded = config.load();
    if (!loaded.success) {
        std::cerr << "Config error: " << loaded.error << "\n";
        return exit_code_for(ErrorKind::Config);
    }
    const auto& d = config.data();

    ProcessRegistry registry(config.state_path());
    if (!registry.load()) {
        std::cerr << "Warning: cannot read " << config.state_path() << "\n";
    }

    pid_t sup = registry.supervisor_pid();
    bool sup_alive = ProcessHandle::is_alive(sup);
    std::cout << "Supervisor: "
              << (sup_alive ? "running (pid " + std::to_string(sup) + ")" : "stopped") << "\n";

    auto print_service = [&](const char* label, const char* role, uint16_t port) {
        pid_t pid = registry.recorded_pid(role);
        bool alive = ProcessHandle::is_alive(pid);
        bool bound = PortProbe::is_occupied(port);
        std::cout << std::left << std::setw(12) << label
                  << (alive ? "running (pid " + std::to_string(pid) + ")" : "stopped")
                  << ", port " << port << (bound ? " in use" : " free") << "\n";
    };
    print_service("Backend:", "backend", d.backend_port);
    print_service("Frontend:", "frontend", d.frontend_port);

    BackendClient client("127.0.0.1", d.backend_port, 2);
    if (client.test_connection()) {
        auto info = client.get_system_info();
        std::cout << "API:        reachable";
        if (info.valid && !info.os.empty()) {
            std::cout << " (" << info.os << " " << info.os_release << ", cpu "
                      << std::fixed << std::setprecision(1) << info.cpu_usage_percent << "%, mem "
                      << info.memory_used_gb << "/" << info.memory_total_gb << " GB)";
        }
        std::cout << "\n";
        auto images = client.get_image_files();
        if (images.valid) {
            std::cout << "Images:     " << images.count << " file(s)";
            if (!images.directory.empty()) std::cout << " in " << images.directory;
            std::cout << "\n";
        }
    } else {
        std::cout << "API:        not reachable\n";
    }

    return 0;
}

// ── stop ────────────────────────────────────────────────────

int CLI::cmd_stop() {
    Config config;
    auto loaded = config.load();
    if (!loaded.success) {
        std::cerr << "Config error: " << loaded.error << "\n";
        return exit_code_for(ErrorKind::Config);
    }

    ProcessRegistry registry(config.state_path());
    if (!registry.load()) {
        std::cerr << "Cannot read " << config.state_path() << "\n";
        return 1;
    }
    pid_t sup = registry.supervisor_pid();
    if (!ProcessHandle::is_alive(sup)) {
        std::cerr << "nasmon is not running\n";
        return 1;
    }

    // Guard against a recycled PID: only signal something that looks like us
    ProcessSignature self{"supervisor", {"nasmon"}};
    if (!self.matches(ProcessHandle::read_cmdline(sup))) {
        std::cerr << "PID " << sup << " is not a nasmon supervisor; remove "
                  << config.state_path() << " if it is stale\n";
        return 1;
    }

    if (kill(sup, SIGTERM) != 0) {
        std::cerr << "Cannot signal supervisor (pid " << sup << "): " << std::strerror(errno) << "\n";
        return 1;
    }
    std::cout << "Stopping supervisor (pid " << sup << ")...\n";

    for (int i = 0; i < STOP_TIMEOUT_SEC * 10; ++i) {
        if (!ProcessHandle::is_alive(sup)) {
            std::cout << "Stopped\n";
            return 0;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    std::cerr << "Supervisor did not exit within " << STOP_TIMEOUT_SEC << "s\n";
    return 1;
}
