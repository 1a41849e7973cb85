// ============= main.cpp - attendance kiosk =============
#include "database/attendance_ledger.hpp"
#include "logging_setup.hpp"
#include "recognition/lbph_face_analyzer.hpp"
#include "session/session_controller.hpp"
#include "session/session_events.hpp"
#include "settings.hpp"
#include "streaming/frame_source.hpp"
#include <spdlog/spdlog.h>
#include <atomic>
#include <csignal>
#include <cstdio>
#include <memory>
#include <string>
#include <thread>

std::atomic<bool> stop_signal(false);

void signal_handler(int sig) {
    if (sig == SIGINT || sig == SIGTERM) {
        stop_signal = true;
    }
}

int main(int argc, char* argv[]) {
    std::string config_file = Config::DEFAULT_CONFIG_FILE;
    bool accept_consent = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--accept-consent") {
            accept_consent = true;
        } else if (arg == "--help" || arg == "-h") {
            std::printf("Usage: %s [config.toml] [--accept-consent]\n", argv[0]);
            return 0;
        } else {
            config_file = arg;
        }
    }

    Settings settings = load_settings(config_file);
    setup_logging(settings.log_dir);

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    if (accept_consent && !settings.consent_accepted) {
        settings.consent_accepted = true;
        if (!save_settings(settings, config_file)) {
            spdlog::warn("Consent accepted but could not be saved to {}", config_file);
        }
    }
    if (!settings.consent_accepted) {
        spdlog::error("Camera consent not recorded. Run again with --accept-consent.");
        return 1;
    }

    std::unique_ptr<AttendanceLedger> ledger;
    try {
        ledger = std::make_unique<AttendanceLedger>(settings.database_path);
    } catch (const std::exception& e) {
        spdlog::error("Error: {}", e.what());
        return 1;
    }

    LbphFaceAnalyzer::Options analyzer_opt;
    analyzer_opt.model_path = settings.model_path;
    analyzer_opt.cascade_path = settings.cascade_path;
    analyzer_opt.face_size = Config::FACE_SIZE;
    LbphFaceAnalyzer analyzer(analyzer_opt);

    std::unique_ptr<CameraFrameSource> source;
    if (settings.camera_source.empty()) {
        source = std::make_unique<CameraFrameSource>(settings.camera_index,
                                                     Config::DEFAULT_FRAME_WIDTH,
                                                     Config::DEFAULT_FRAME_HEIGHT);
    } else {
        source = std::make_unique<CameraFrameSource>(settings.camera_source);
    }

    SessionController session(*ledger, analyzer, *source, SessionOptions::from_settings(settings));

    SessionEventQueue events;
    session.set_status_callback(events.status_callback());
    session.set_log_callback(events.log_callback());

    std::atomic<bool> session_done(false);
    SessionOutcome outcome;
    std::string start_error;

    std::thread worker([&]() {
        try {
            outcome = session.run();
        } catch (const SessionError& e) {
            start_error = e.what();
        }
        session_done = true;
    });

    // Observer loop: drain notifications on the main thread.
    while (!session_done.load() || events.size() > 0) {
        if (stop_signal.load()) {
            session.request_stop();
        }

        SessionEvent ev;
        if (!events.pop(ev, 100)) continue;

        if (ev.type == SessionEvent::Type::Log) {
            spdlog::info("✓ {} checked in at {}", ev.name, ev.time_str);
        } else {
            spdlog::info("{}", ev.message);
        }
    }

    worker.join();

    if (!start_error.empty()) {
        spdlog::error("{}", start_error);
        return 1;
    }

    spdlog::info("Session {} ({} frames, {} logs)",
                 session_state_to_string(outcome.state), outcome.frames, outcome.logs);
    return outcome.state == SessionState::Aborted ? 2 : 0;
}
