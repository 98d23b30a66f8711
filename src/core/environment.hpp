#pragma once

#include <string>
#include <vector>

/// Isolated Python runtime (a venv directory) the children run inside.
class RuntimeEnvironment {
public:
    RuntimeEnvironment(std::string venv_dir, std::string base_python);
    ~RuntimeEnvironment();

    struct Result { bool success; std::string error; };

    /// Reuse venv_dir when its interpreter exists, otherwise create it once
    Result ensure_created();

    /// Check that every path exists (backend script, static index, ...)
    static Result check_files(const std::vector<std::string>& paths);

    /// Import-check the python modules inside the venv; optionally pip-install
    /// the missing ones and check again
    Result ensure_dependencies(const std::vector<std::string>& modules, bool install_missing);

    /// Export VIRTUAL_ENV and put <venv>/bin first on PATH for spawned children
    void activate();

    /// Undo activate(). Best-effort, safe to call repeatedly.
    void deactivate();

    bool is_active() const { return active_; }

    const std::string& venv_dir() const { return venv_dir_; }
    std::string interpreter() const;
    std::string bin_dir() const;

private:
    std::string venv_dir_;
    std::string base_python_;

    bool active_ = false;
    bool had_path_ = false;
    std::string saved_path_;
    bool had_virtual_env_ = false;
    std::string saved_virtual_env_;

    /// Run a shell command and return its exit status (-1 if it did not run)
    static int run_command(const std::string& cmd);
    static std::string shell_quote(const std::string& s);
};
