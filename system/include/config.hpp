#pragma once
#include <cstddef>
#include <string>

namespace Config {

    // Camera defaults
    constexpr int DEFAULT_CAMERA_INDEX = 0;
    constexpr int DEFAULT_FRAME_WIDTH = 640;
    constexpr int DEFAULT_FRAME_HEIGHT = 480;
    constexpr int CAMERA_OPEN_RETRIES = 3;
    constexpr int RETRY_DELAY_MS = 500;

    // Session defaults
    constexpr int DEFAULT_SESSION_SECONDS = 90;
    constexpr int MIN_SESSION_SECONDS = 10;
    constexpr bool DEFAULT_STOP_ON_SUCCESS = true;
    constexpr int DEFAULT_IDLE_HINT_SECONDS = 20;

    // Recognition defaults (LBPH distance, lower is better)
    constexpr double DEFAULT_THRESHOLD = 90.0;
    constexpr double MIN_THRESHOLD = 1.0;
    constexpr double FALLBACK_QUALITY_THRESHOLD = 100.0;
    constexpr int DEFAULT_STABLE_FRAMES = 4;
    constexpr int DEFAULT_STABLE_WINDOW = 8;
    constexpr int FACE_SIZE = 200;

    // Attendance policy defaults
    constexpr int DEFAULT_MIN_MINUTES_BETWEEN_LOGS = 10;
    constexpr bool DEFAULT_ENFORCE_ONE_PER_DAY = true;

    // Paths
    constexpr const char* DEFAULT_CONFIG_FILE = "config.toml";
    constexpr const char* DEFAULT_DB_PATH = "data/attendance.sqlite3";
    constexpr const char* DEFAULT_MODEL_PATH = "models/trainer.yml";
    constexpr const char* DEFAULT_CASCADE_PATH = "assets/haarcascade_frontalface_default.xml";
    constexpr const char* DEFAULT_LOG_DIR = "logs";

    // Logging
    constexpr const char* LOG_FILE_NAME = "faceattendance.log";
    constexpr size_t LOG_MAX_BYTES = 1000000;
    constexpr size_t LOG_BACKUP_COUNT = 3;

    // SQLite
    constexpr int DB_BUSY_TIMEOUT_MS = 5000;

    // Export periods
    constexpr const char* PERIOD_DAILY = "daily";
    constexpr const char* PERIOD_WEEKLY = "weekly";
    constexpr const char* PERIOD_MONTHLY = "monthly";
}
