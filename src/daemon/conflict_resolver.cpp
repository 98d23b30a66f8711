#include "daemon/conflict_resolver.hpp"
#include "daemon/port_probe.hpp"
#include "daemon/process_handle.hpp"
#include "daemon/process_registry.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

static bool token_matches(const std::string& token, const std::string& arg) {
    if (arg == token) return true;
    return fs::path(arg).filename().string() == token;
}

bool ProcessSignature::matches(const std::vector<std::string>& argv) const {
    // An empty signature would match everything
    if (tokens.empty() || argv.empty()) return false;

    size_t next = 0;
    for (const auto& arg : argv) {
        if (token_matches(tokens[next], arg)) {
            if (++next == tokens.size()) return true;
        }
    }
    return false;
}

std::string ProcessSignature::describe() const {
    std::string out = role + "[";
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (i) out += " ";
        out += tokens[i];
    }
    return out + "]";
}

ConflictResolver::ConflictResolver(std::chrono::milliseconds settle,
                                   std::chrono::milliseconds terminate_grace,
                                   const ProcessRegistry* registry)
    : settle_(settle), terminate_grace_(terminate_grace), registry_(registry) {}

std::vector<pid_t> ConflictResolver::scan_processes(const ProcessSignature& signature) {
    std::vector<pid_t> pids;
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator("/proc", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(),
                                         [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        pid_t pid = static_cast<pid_t>(std::stol(name));
        if (signature.matches(ProcessHandle::read_cmdline(pid))) {
            pids.push_back(pid);
        }
    }
    if (ec) {
        spdlog::warn("[Conflict] Cannot scan /proc: {}", ec.message());
    }
    return pids;
}

std::vector<pid_t> ConflictResolver::find_candidates(const ProcessSignature& signature) const {
    std::vector<pid_t> candidates;
    const pid_t self = getpid();

    // Registry first: PIDs we recorded ourselves, re-checked against the
    // signature in case the PID has been reused
    if (registry_) {
        pid_t recorded = registry_->recorded_pid(signature.role);
        if (recorded > 0 && recorded != self && ProcessHandle::is_alive(recorded) &&
            signature.matches(ProcessHandle::read_cmdline(recorded))) {
            candidates.push_back(recorded);
        }
    }

    for (pid_t pid : scan_processes(signature)) {
        if (pid == self) continue;
        if (std::find(candidates.begin(), candidates.end(), pid) != candidates.end()) continue;
        candidates.push_back(pid);
    }
    return candidates;
}

ConflictResolver::EnsureFreeResult ConflictResolver::ensure_free(
        uint16_t port, const ProcessSignature& signature) const {
    EnsureFreeResult result;
    result.port = port;

    if (!PortProbe::is_occupied(port)) {
        result.success = true;
        return result;
    }

    spdlog::warn("[Conflict] Port {} is in use, looking for stale {} processes",
                 port, signature.describe());

    for (pid_t pid : find_candidates(signature)) {
        spdlog::info("[Conflict] Stopping previous instance PID {}", pid);
        // Only the matching process itself: its group may hold unrelated jobs
        ProcessHandle::terminate(pid, terminate_grace_);
        result.terminated.push_back(pid);
    }

    std::this_thread::sleep_for(settle_);

    if (PortProbe::is_occupied(port)) {
        result.error = "port " + std::to_string(port) +
                       " is still in use by another process; check it manually";
        spdlog::error("[Conflict] {}", result.error);
        return result;
    }

    spdlog::info("[Conflict] Port {} is free", port);
    result.success = true;
    return result;
}
