#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <cstdlib>

namespace fs = std::filesystem;

namespace {

bool read_port(const YAML::Node& root, const char* key, uint16_t& out, std::string& error) {
    YAML::Node node = root[key];
    if (!node || node.IsNull()) {
        error = std::string("missing required field '") + key + "'";
        return false;
    }
    int value = 0;
    try {
        value = node.as<int>();
    } catch (const YAML::Exception&) {
        error = std::string("field '") + key + "' is not an integer";
        return false;
    }
    if (value <= 0 || value > 65535) {
        error = std::string("field '") + key + "' out of range: " + std::to_string(value);
        return false;
    }
    out = static_cast<uint16_t>(value);
    return true;
}

/// Present keys must convert; absent or null keys keep the default in out
template <typename T>
bool read_optional(const YAML::Node& parent, const std::string& key, T& out, std::string& error) {
    YAML::Node node = parent[key];
    if (!node || node.IsNull()) return true;
    if (!node.IsScalar()) {
        error = "field '" + key + "' must be a single value";
        return false;
    }
    try {
        out = node.as<T>();
    } catch (const YAML::BadConversion&) {
        error = "field '" + key + "' has the wrong type";
        return false;
    }
    return true;
}

}  // namespace

Config::Config() : base_dir_(project_dir()) {}

Config::~Config() = default;

std::string Config::project_dir() {
    const char* home = std::getenv("NASMON_HOME");
    if (home && *home) return home;
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) return ".";
    return cwd.string();
}

std::string Config::config_path() {
    return (fs::path(project_dir()) / "config.json").string();
}

Config::LoadResult Config::load() {
    return load(config_path());
}

Config::LoadResult Config::load(const std::string& path) {
    if (path.empty() || !fs::exists(path)) {
        return {false, "config file not found: " + path};
    }
    base_dir_ = fs::path(path).parent_path().string();
    if (base_dir_.empty()) base_dir_ = ".";

    AppConfig parsed;
    try {
        YAML::Node root = YAML::LoadFile(path);
        if (!root.IsMap()) {
            return {false, "config root must be an object: " + path};
        }

        std::string error;
        if (!read_port(root, "frontend_port", parsed.frontend_port, error) ||
            !read_port(root, "backend_port", parsed.backend_port, error)) {
            return {false, error};
        }
        if (parsed.frontend_port == parsed.backend_port) {
            return {false, "frontend_port and backend_port must differ (both " +
                           std::to_string(parsed.frontend_port) + ")"};
        }

        if (!read_optional(root, "python", parsed.python, error) ||
            !read_optional(root, "venv_dir", parsed.venv_dir, error) ||
            !read_optional(root, "backend_script", parsed.backend_script, error) ||
            !read_optional(root, "frontend_index", parsed.frontend_index, error) ||
            !read_optional(root, "logs_dir", parsed.logs_dir, error) ||
            !read_optional(root, "run_dir", parsed.run_dir, error) ||
            !read_optional(root, "log_level", parsed.log_level, error) ||
            !read_optional(root, "install_missing_dependencies",
                           parsed.install_missing_dependencies, error)) {
            return {false, error};
        }

        if (auto deps = root["dependencies"]) {
            if (!deps.IsSequence()) {
                return {false, "field 'dependencies' must be a list"};
            }
            parsed.dependencies.clear();
            for (const auto& dep : deps) {
                if (!dep.IsScalar()) {
                    return {false, "field 'dependencies' must list module names"};
                }
                parsed.dependencies.push_back(dep.as<std::string>());
            }
        }

        if (auto timing = root["timing"]) {
            if (!timing.IsMap()) {
                return {false, "field 'timing' must be an object"};
            }
            auto& t = parsed.timing;
            if (!read_optional(timing, "port_settle_ms", t.port_settle_ms, error) ||
                !read_optional(timing, "start_settle_ms", t.start_settle_ms, error) ||
                !read_optional(timing, "terminate_grace_ms", t.terminate_grace_ms, error) ||
                !read_optional(timing, "poll_interval_ms", t.poll_interval_ms, error)) {
                return {false, "timing: " + error};
            }
            if (t.port_settle_ms < 0 || t.start_settle_ms < 0 ||
                t.terminate_grace_ms < 0 || t.poll_interval_ms <= 0) {
                return {false, "timing values must be non-negative (poll_interval_ms positive)"};
            }
        }
    } catch (const YAML::Exception& e) {
        return {false, "cannot parse " + path + ": " + e.what()};
    }

    config_ = std::move(parsed);
    return {true, ""};
}

std::string Config::resolve(const std::string& path) const {
    fs::path p(path);
    if (p.is_absolute()) return p.string();
    return (fs::path(base_dir_) / p).lexically_normal().string();
}

std::string Config::backend_log_path() const {
    return (fs::path(resolve(config_.logs_dir)) / "api_server.log").string();
}

std::string Config::frontend_log_path() const {
    return (fs::path(resolve(config_.logs_dir)) / "http_server.log").string();
}

std::string Config::supervisor_log_path() const {
    return (fs::path(resolve(config_.logs_dir)) / "supervisor.log").string();
}

std::string Config::state_path() const {
    return (fs::path(resolve(config_.run_dir)) / "supervisor.json").string();
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
