// ============= src/settings.cpp =============
#include "settings.hpp"
#include "simple_toml.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace {

const char* bool_str(bool b) {
    return b ? "true" : "false";
}

} // namespace

Settings load_settings(const std::string& path) {
    Settings s;

    SimpleToml toml;
    if (!toml.load(path)) {
        spdlog::warn("Config {} not found, using defaults", path);
        return s;
    }

    s.camera_index = toml.get_int("camera.index", s.camera_index);
    s.camera_source = toml.get("camera.source", s.camera_source);

    s.session_seconds = std::max(Config::MIN_SESSION_SECONDS,
                                 toml.get_int("session.seconds", s.session_seconds));
    s.stop_on_success = toml.get_bool("session.stop_on_success", s.stop_on_success);
    s.idle_hint_seconds = std::max(0, toml.get_int("session.idle_hint_seconds", s.idle_hint_seconds));

    s.threshold = std::max(Config::MIN_THRESHOLD,
                           toml.get_double("recognition.threshold", s.threshold));
    s.stable_frames = std::max(1, toml.get_int("recognition.stable_frames", s.stable_frames));
    s.stable_window = std::max(1, toml.get_int("recognition.stable_window", s.stable_window));

    s.min_minutes_between_logs = std::max(
        0, toml.get_int("attendance.min_minutes_between_logs", s.min_minutes_between_logs));
    s.enforce_one_per_day = toml.get_bool("attendance.enforce_one_per_day", s.enforce_one_per_day);

    s.database_path = toml.get("paths.database", s.database_path);
    s.model_path = toml.get("paths.model", s.model_path);
    s.cascade_path = toml.get("paths.cascade", s.cascade_path);
    s.log_dir = toml.get("paths.logs", s.log_dir);

    s.privacy_mode = toml.get_bool("privacy.privacy_mode", s.privacy_mode);
    s.consent_accepted = toml.get_bool("privacy.consent_accepted", s.consent_accepted);

    return s;
}

bool save_settings(const Settings& s, const std::string& path) {
    std::filesystem::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec) {
            spdlog::error("Cannot create {}: {}", p.parent_path().string(), ec.message());
            return false;
        }
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) {
        spdlog::error("Cannot write settings to {}", path);
        return false;
    }

    out << "[camera]\n"
        << "index = " << s.camera_index << "\n"
        << "source = " << SimpleToml::quote(s.camera_source) << "\n\n"
        << "[session]\n"
        << "seconds = " << s.session_seconds << "\n"
        << "stop_on_success = " << bool_str(s.stop_on_success) << "\n"
        << "idle_hint_seconds = " << s.idle_hint_seconds << "\n\n"
        << "[recognition]\n"
        << "threshold = " << s.threshold << "\n"
        << "stable_frames = " << s.stable_frames << "\n"
        << "stable_window = " << s.stable_window << "\n\n"
        << "[attendance]\n"
        << "min_minutes_between_logs = " << s.min_minutes_between_logs << "\n"
        << "enforce_one_per_day = " << bool_str(s.enforce_one_per_day) << "\n\n"
        << "[paths]\n"
        << "database = " << SimpleToml::quote(s.database_path) << "\n"
        << "model = " << SimpleToml::quote(s.model_path) << "\n"
        << "cascade = " << SimpleToml::quote(s.cascade_path) << "\n"
        << "logs = " << SimpleToml::quote(s.log_dir) << "\n\n"
        << "[privacy]\n"
        << "privacy_mode = " << bool_str(s.privacy_mode) << "\n"
        << "consent_accepted = " << bool_str(s.consent_accepted) << "\n";

    out.flush();
    return static_cast<bool>(out);
}
