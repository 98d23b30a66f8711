#include "core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <vector>

namespace fs = std::filesystem;

bool setup_logging(const std::string& level, const std::string& file_path) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    bool file_ok = true;
    if (!file_path.empty()) {
        try {
            auto parent = fs::path(file_path).parent_path();
            if (!parent.empty()) fs::create_directories(parent);
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, false));
        } catch (const std::exception& e) {
            // spdlog_ex and filesystem_error both land here
            file_ok = false;
            fprintf(stderr, "nasmon: cannot open log file %s: %s\n", file_path.c_str(), e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("nasmon", sinks.begin(), sinks.end());
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    auto lvl = spdlog::level::from_str(level);
    if (lvl == spdlog::level::off && level != "off") {
        lvl = spdlog::level::info;
    }
    logger->set_level(lvl);
    logger->flush_on(spdlog::level::info);

    spdlog::set_default_logger(logger);
    return file_ok;
}
