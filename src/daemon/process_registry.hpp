#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <sys/types.h>

struct RegistryEntry {
    pid_t pid = -1;
    uint16_t port = 0;
    std::string log_path;
};

/// PIDs this supervisor (or a previous run of it) started, persisted as JSON
/// so a later run or `nasmon status` can find them.
class ProcessRegistry {
public:
    explicit ProcessRegistry(std::string state_path);

    /// Read the state file; missing file means empty registry
    bool load();
    bool save() const;

    void set_supervisor_pid(pid_t pid);
    pid_t supervisor_pid() const { return supervisor_pid_; }

    void record(const std::string& role, pid_t pid, uint16_t port, const std::string& log_path);
    void clear(const std::string& role);
    void clear_all();

    /// -1 when nothing is recorded for role
    pid_t recorded_pid(const std::string& role) const;
    const std::map<std::string, RegistryEntry>& entries() const { return entries_; }

    const std::string& state_path() const { return state_path_; }

private:
    std::string state_path_;
    pid_t supervisor_pid_ = -1;
    std::map<std::string, RegistryEntry> entries_;
};
