#pragma once
#include "config.hpp"
#include <string>

// Kiosk preferences, persisted as TOML.
struct Settings {
    // [camera]
    int camera_index = Config::DEFAULT_CAMERA_INDEX;
    std::string camera_source;            // URL or file; empty -> camera_index

    // [session]
    int session_seconds = Config::DEFAULT_SESSION_SECONDS;
    bool stop_on_success = Config::DEFAULT_STOP_ON_SUCCESS;
    int idle_hint_seconds = Config::DEFAULT_IDLE_HINT_SECONDS;

    // [recognition]
    double threshold = Config::DEFAULT_THRESHOLD;
    int stable_frames = Config::DEFAULT_STABLE_FRAMES;
    int stable_window = Config::DEFAULT_STABLE_WINDOW;

    // [attendance]
    int min_minutes_between_logs = Config::DEFAULT_MIN_MINUTES_BETWEEN_LOGS;
    bool enforce_one_per_day = Config::DEFAULT_ENFORCE_ONE_PER_DAY;

    // [paths]
    std::string database_path = Config::DEFAULT_DB_PATH;
    std::string model_path = Config::DEFAULT_MODEL_PATH;
    std::string cascade_path = Config::DEFAULT_CASCADE_PATH;
    std::string log_dir = Config::DEFAULT_LOG_DIR;

    // [privacy]
    bool privacy_mode = false;
    bool consent_accepted = false;
};

// Returns defaults when the file is missing or unreadable. Out-of-range values
// are clamped (session >= 10 s, threshold >= 1, minutes >= 0, windows >= 1).
Settings load_settings(const std::string& path);

// Writes every key, creating parent directories. Returns false on I/O failure.
bool save_settings(const Settings& settings, const std::string& path);
