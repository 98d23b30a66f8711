#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>
#include <sys/types.h>

class ProcessRegistry;

/// Describes a process this supervisor owns: its registry role plus argv
/// tokens that must appear in order. A token matches an argv element equal to
/// it, or whose file name equals it ("system_info.py" matches
/// "/srv/nas/system_info.py"; "8000" does not match "18000").
struct ProcessSignature {
    std::string role;
    std::vector<std::string> tokens;

    bool matches(const std::vector<std::string>& argv) const;
    std::string describe() const;
};

/// Frees a port held by a previous instance of our own children. Never
/// signals a process that does not match the signature.
class ConflictResolver {
public:
    explicit ConflictResolver(std::chrono::milliseconds settle = std::chrono::milliseconds(2000),
                              std::chrono::milliseconds terminate_grace = std::chrono::milliseconds(1000),
                              const ProcessRegistry* registry = nullptr);

    struct EnsureFreeResult {
        bool success = false;
        std::string error;
        uint16_t port = 0;
        std::vector<pid_t> terminated;  // remediated PIDs
    };

    EnsureFreeResult ensure_free(uint16_t port, const ProcessSignature& signature) const;

    /// Live processes (other than ourselves) whose argv matches signature
    std::vector<pid_t> find_candidates(const ProcessSignature& signature) const;

    /// Scan /proc for processes matching signature
    static std::vector<pid_t> scan_processes(const ProcessSignature& signature);

private:
    std::chrono::milliseconds settle_;
    std::chrono::milliseconds terminate_grace_;
    const ProcessRegistry* registry_;
};
