// ============= include/session/session_controller.hpp =============
/*
 * Session Controller - one attendance capture session
 *
 * STATES:
 *   Idle -> Running -> Completed | Aborted
 *
 * PER FRAME:
 * - no faces: idle hint check only
 * - per face: quality -> stabilizer.observe/decide -> threshold gate
 *   -> ledger.log_attendance -> status/log callbacks
 *
 * ENDS WHEN:
 * - Completed: duration elapsed, stop_on_success after a log, request_stop()
 * - Aborted:   source cannot be opened or stops yielding frames, ledger failure
 *
 * Callbacks run on the session thread. Observers on another thread should
 * go through SessionEventQueue.
 */

#pragma once
#include "database/attendance_ledger.hpp"
#include "recognition/face_analyzer.hpp"
#include "recognition/temporal_stabilizer.hpp"
#include "session/session_events.hpp"
#include "settings.hpp"
#include "streaming/frame_source.hpp"
#include "time_utils.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <stdexcept>
#include <string>

enum class SessionState {
    Idle = 0,
    Running,
    Completed,
    Aborted
};

const char* session_state_to_string(SessionState state);

struct SessionOptions {
    int session_seconds = Config::DEFAULT_SESSION_SECONDS;
    double threshold = Config::DEFAULT_THRESHOLD;
    int stable_frames = Config::DEFAULT_STABLE_FRAMES;
    int stable_window = Config::DEFAULT_STABLE_WINDOW;
    bool stop_on_success = Config::DEFAULT_STOP_ON_SUCCESS;
    int idle_hint_seconds = Config::DEFAULT_IDLE_HINT_SECONDS;
    int min_minutes_between_logs = Config::DEFAULT_MIN_MINUTES_BETWEEN_LOGS;
    bool enforce_one_per_day = Config::DEFAULT_ENFORCE_ONE_PER_DAY;

    static SessionOptions from_settings(const Settings& s);
};

struct SessionOutcome {
    SessionState state = SessionState::Idle;
    bool logged = false;       // at least one successful insert
    int logs = 0;
    int frames = 0;
    std::string last_status;
};

// Raised before Running: missing prerequisites or source already in use.
class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& what) : std::runtime_error(what) {}
};

class SessionController {
public:
    using WallClock = std::function<TimeUtils::TimePoint()>;
    using MonotonicClock = std::function<std::chrono::steady_clock::time_point()>;

    SessionController(AttendanceLedger& ledger,
                      FaceAnalyzer& analyzer,
                      FrameSource& source,
                      const SessionOptions& options = SessionOptions(),
                      WallClock wall_clock = &TimeUtils::Clock::now,
                      MonotonicClock monotonic_clock = &std::chrono::steady_clock::now);

    void set_status_callback(StatusCallback cb) { status_cb = std::move(cb); }
    void set_log_callback(LogCallback cb) { log_cb = std::move(cb); }

    // Blocking. Throws SessionError if the session cannot start.
    SessionOutcome run();

    // Thread-safe; the loop completes at the next frame boundary. A stop
    // requested before run() ends that run immediately. Cleared when run() returns.
    void request_stop() { stop_requested = true; }

    SessionState state() const { return current_state.load(); }
    std::string last_status_message() const;
    const SessionOptions& options() const { return opts; }

private:
    AttendanceLedger& ledger;
    FaceAnalyzer& analyzer;
    FrameSource& source;
    SessionOptions opts;
    WallClock wall_clock;
    MonotonicClock monotonic_clock;

    StatusCallback status_cb;
    LogCallback log_cb;

    std::atomic<SessionState> current_state{SessionState::Idle};
    std::atomic<bool> stop_requested{false};

    mutable std::mutex status_mutex;
    std::string last_status;

    void emit_status(const std::string& message, bool force = false);
    void emit_log(const std::string& name, const std::string& time_str);

    // Returns true when a new attendance row was written.
    bool handle_detection(const Detection& det,
                          TemporalStabilizer& stabilizer,
                          const std::map<int, std::string>& identities);
};
