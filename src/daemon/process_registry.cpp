#include "daemon/process_registry.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

ProcessRegistry::ProcessRegistry(std::string state_path)
    : state_path_(std::move(state_path)) {}

bool ProcessRegistry::load() {
    supervisor_pid_ = -1;
    entries_.clear();

    if (!fs::exists(state_path_)) return true;

    std::ifstream in(state_path_);
    if (!in.is_open()) return false;

    try {
        json root = json::parse(in);
        supervisor_pid_ = root.value("supervisor_pid", -1);
        for (const auto& item : root.items()) {
            const auto& j = item.value();
            if (!j.is_object()) continue;
            RegistryEntry entry;
            entry.pid = j.value("pid", -1);
            entry.port = j.value("port", static_cast<uint16_t>(0));
            entry.log_path = j.value("log", "");
            if (entry.pid > 0) entries_[item.key()] = entry;
        }
        return true;
    } catch (const json::exception& e) {
        spdlog::warn("[Registry] Ignoring unreadable state file {}: {}", state_path_, e.what());
        return false;
    }
}

bool ProcessRegistry::save() const {
    try {
        auto parent = fs::path(state_path_).parent_path();
        if (!parent.empty()) fs::create_directories(parent);

        json root;
        root["supervisor_pid"] = supervisor_pid_;
        for (const auto& [role, entry] : entries_) {
            root[role] = {
                {"pid", entry.pid},
                {"port", entry.port},
                {"log", entry.log_path}
            };
        }

        // Write-then-rename so readers never see a half-written file
        std::string tmp = state_path_ + ".tmp";
        {
            std::ofstream out(tmp);
            if (!out.is_open()) return false;
            out << root.dump(2) << "\n";
            if (!out) return false;
        }
        fs::rename(tmp, state_path_);
        return true;
    } catch (const std::exception& e) {
        spdlog::warn("[Registry] Cannot write {}: {}", state_path_, e.what());
        return false;
    }
}

void ProcessRegistry::set_supervisor_pid(pid_t pid) {
    supervisor_pid_ = pid;
}

void ProcessRegistry::record(const std::string& role, pid_t pid, uint16_t port,
                             const std::string& log_path) {
    entries_[role] = RegistryEntry{pid, port, log_path};
}

void ProcessRegistry::clear(const std::string& role) {
    entries_.erase(role);
}

void ProcessRegistry::clear_all() {
    supervisor_pid_ = -1;
    entries_.clear();
}

pid_t ProcessRegistry::recorded_pid(const std::string& role) const {
    auto it = entries_.find(role);
    if (it == entries_.end()) return -1;
    return it->second.pid;
}
