#include "core/environment.hpp"

#include <spdlog/spdlog.h>
#include <filesystem>
#include <cstdlib>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

RuntimeEnvironment::RuntimeEnvironment(std::string venv_dir, std::string base_python)
    : venv_dir_(std::move(venv_dir)), base_python_(std::move(base_python)) {}

RuntimeEnvironment::~RuntimeEnvironment() {
    deactivate();
}

std::string RuntimeEnvironment::shell_quote(const std::string& s) {
    std::string result = "'";
    for (char c : s) {
        if (c == '\'') {
            result += "'\\''";
        } else {
            result += c;
        }
    }
    result += "'";
    return result;
}

int RuntimeEnvironment::run_command(const std::string& cmd) {
    int status = std::system(cmd.c_str());
    if (status == -1 || !WIFEXITED(status)) return -1;
    return WEXITSTATUS(status);
}

std::string RuntimeEnvironment::bin_dir() const {
    return (fs::path(venv_dir_) / "bin").string();
}

std::string RuntimeEnvironment::interpreter() const {
    return (fs::path(bin_dir()) / "python").string();
}

RuntimeEnvironment::Result RuntimeEnvironment::ensure_created() {
    if (fs::exists(interpreter())) {
        spdlog::info("[Env] Reusing virtual environment {}", venv_dir_);
        return {true, ""};
    }

    spdlog::info("[Env] Creating virtual environment {} with {}", venv_dir_, base_python_);
    std::string cmd = shell_quote(base_python_) + " -m venv " + shell_quote(venv_dir_);
    int rc = run_command(cmd);
    if (rc != 0) {
        return {false, "'" + base_python_ + " -m venv' failed (status " + std::to_string(rc) +
                       "); is python3-venv installed?"};
    }
    if (!fs::exists(interpreter())) {
        return {false, "virtual environment has no interpreter at " + interpreter()};
    }
    spdlog::info("[Env] Virtual environment created");
    return {true, ""};
}

RuntimeEnvironment::Result RuntimeEnvironment::check_files(const std::vector<std::string>& paths) {
    for (const auto& path : paths) {
        if (!fs::exists(path)) {
            return {false, "required file not found: " + path};
        }
    }
    return {true, ""};
}

RuntimeEnvironment::Result RuntimeEnvironment::ensure_dependencies(
        const std::vector<std::string>& modules, bool install_missing) {
    if (modules.empty()) return {true, ""};

    std::string joined;
    for (const auto& m : modules) {
        if (!joined.empty()) joined += ", ";
        joined += m;
    }
    std::string check = shell_quote(interpreter()) + " -c " +
                        shell_quote("import " + joined) + " >/dev/null 2>&1";

    if (run_command(check) == 0) {
        spdlog::info("[Env] Python dependencies present: {}", joined);
        return {true, ""};
    }
    if (!install_missing) {
        return {false, "missing python dependencies (" + joined + ") and installing is disabled"};
    }

    spdlog::info("[Env] Installing python dependencies: {}", joined);
    std::string install = shell_quote((fs::path(bin_dir()) / "pip").string()) + " install";
    for (const auto& m : modules) {
        install += " " + shell_quote(m);
    }
    int rc = run_command(install);
    if (rc != 0) {
        return {false, "pip install failed (status " + std::to_string(rc) +
                       "); check the network connection"};
    }
    if (run_command(check) != 0) {
        return {false, "dependencies still not importable after install: " + joined};
    }
    return {true, ""};
}

void RuntimeEnvironment::activate() {
    if (active_) return;

    const char* path = std::getenv("PATH");
    had_path_ = path != nullptr;
    saved_path_ = path ? path : "";
    const char* venv = std::getenv("VIRTUAL_ENV");
    had_virtual_env_ = venv != nullptr;
    saved_virtual_env_ = venv ? venv : "";

    std::string new_path = bin_dir();
    if (!saved_path_.empty()) new_path += ":" + saved_path_;
    setenv("PATH", new_path.c_str(), 1);
    setenv("VIRTUAL_ENV", venv_dir_.c_str(), 1);
    active_ = true;
    spdlog::debug("[Env] Activated {}", venv_dir_);
}

void RuntimeEnvironment::deactivate() {
    if (!active_) return;

    if (had_path_) {
        setenv("PATH", saved_path_.c_str(), 1);
    } else {
        unsetenv("PATH");
    }
    if (had_virtual_env_) {
        setenv("VIRTUAL_ENV", saved_virtual_env_.c_str(), 1);
    } else {
        unsetenv("VIRTUAL_ENV");
    }
    active_ = false;
    spdlog::info("[Env] Deactivated virtual environment");
}
