// ============= src/logging_setup.cpp =============
#include "logging_setup.hpp"
#include "config.hpp"
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <filesystem>
#include <memory>
#include <mutex>
#include <vector>

namespace {
std::once_flag logging_once;
}

void setup_logging(const std::string& log_dir, spdlog::level::level_enum level) {
    std::call_once(logging_once, [&log_dir]() {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());

        try {
            std::filesystem::create_directories(log_dir);
            auto file = (std::filesystem::path(log_dir) / Config::LOG_FILE_NAME).string();
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                file, Config::LOG_MAX_BYTES, Config::LOG_BACKUP_COUNT));
        } catch (const std::exception& e) {
            // Console-only logging is still usable.
            spdlog::warn("File logging disabled ({}): {}", log_dir, e.what());
        }

        auto logger = std::make_shared<spdlog::logger>("attendance", sinks.begin(), sinks.end());
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%^%l%$] %v");
        spdlog::flush_on(spdlog::level::warn);
    });

    spdlog::set_level(level);
}
