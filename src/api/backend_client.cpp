#include "api/backend_client.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

struct BackendClient::Impl {
    std::string host;
    int port;
    int timeout_sec;

    std::unique_ptr<httplib::Client> make_client() {
        auto cli = std::make_unique<httplib::Client>(host, port);
        cli->set_connection_timeout(timeout_sec, 0);
        cli->set_read_timeout(timeout_sec, 0);
        cli->set_write_timeout(timeout_sec, 0);
        return cli;
    }

    /// GET path and parse the body; null json on any failure
    json get_json(const std::string& path) {
        auto cli = make_client();
        auto res = cli->Get(path.c_str());
        if (!res) {
            spdlog::debug("[API] GET {} failed: {}", path, httplib::to_string(res.error()));
            return json();
        }
        if (res->status != 200) {
            spdlog::debug("[API] GET {} returned HTTP {}", path, res->status);
            return json();
        }
        try {
            return json::parse(res->body);
        } catch (const json::exception& e) {
            spdlog::debug("[API] GET {} returned invalid JSON: {}", path, e.what());
            return json();
        }
    }
};

BackendClient::BackendClient(const std::string& host, int port, int timeout_sec)
    : impl_(std::make_unique<Impl>()) {
    impl_->host = host;
    impl_->port = port;
    impl_->timeout_sec = timeout_sec;
}

BackendClient::~BackendClient() = default;

bool BackendClient::test_connection() {
    auto cli = impl_->make_client();
    auto res = cli->Get("/system-info");
    return res && res->status == 200;
}

SystemSummary BackendClient::get_system_info() {
    SystemSummary info;
    json j = impl_->get_json("/system-info");
    if (!j.is_object()) return info;

    try {
        info.os = j.value("os", "");
        info.os_release = j.value("os_release", "");
        if (j.contains("cpu") && j["cpu"].is_object()) {
            const auto& cpu = j["cpu"];
            if (cpu.contains("usage_percent") && cpu["usage_percent"].is_number()) {
                info.cpu_usage_percent = cpu["usage_percent"].get<double>();
            }
        }
        if (j.contains("memory") && j["memory"].is_object()) {
            info.memory_used_gb = j["memory"].value("used_gb", 0.0);
            info.memory_total_gb = j["memory"].value("total_gb", 0.0);
        }
        info.valid = true;
    } catch (const json::exception& e) {
        spdlog::debug("[API] Unexpected /system-info payload: {}", e.what());
    }
    return info;
}

ImageFiles BackendClient::get_image_files() {
    ImageFiles images;
    json j = impl_->get_json("/image-files");
    if (!j.is_object()) return images;

    try {
        if (j.contains("files") && j["files"].is_array()) {
            for (const auto& f : j["files"]) {
                if (f.is_string()) images.files.push_back(f.get<std::string>());
            }
        }
        images.count = j.value("count", static_cast<int>(images.files.size()));
        images.directory = j.value("directory", "");
        images.valid = true;
    } catch (const json::exception& e) {
        spdlog::debug("[API] Unexpected /image-files payload: {}", e.what());
    }
    return images;
}
