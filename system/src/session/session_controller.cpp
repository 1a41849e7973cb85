// ============= src/session/session_controller.cpp =============
#include "session/session_controller.hpp"
#include "recognition/match_quality.hpp"
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <chrono>
#include <set>

const char* session_state_to_string(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Running: return "Running";
        case SessionState::Completed: return "Completed";
        case SessionState::Aborted: return "Aborted";
        default: return "Unknown";
    }
}

SessionOptions SessionOptions::from_settings(const Settings& s) {
    SessionOptions o;
    o.session_seconds = s.session_seconds;
    o.threshold = s.threshold;
    o.stable_frames = s.stable_frames;
    o.stable_window = s.stable_window;
    o.stop_on_success = s.stop_on_success;
    o.idle_hint_seconds = s.idle_hint_seconds;
    o.min_minutes_between_logs = s.min_minutes_between_logs;
    o.enforce_one_per_day = s.enforce_one_per_day;
    return o;
}

namespace {

// Releases and unclaims the source on every exit path.
class SourceLease {
public:
    explicit SourceLease(FrameSource& source) : source(source) {}
    ~SourceLease() {
        source.release();
        source.unclaim();
    }

private:
    FrameSource& source;
};

} // namespace

SessionController::SessionController(AttendanceLedger& ledger,
                                     FaceAnalyzer& analyzer,
                                     FrameSource& source,
                                     const SessionOptions& options,
                                     WallClock wall_clock,
                                     MonotonicClock monotonic_clock)
    : ledger(ledger), analyzer(analyzer), source(source),
      opts(options), wall_clock(std::move(wall_clock)),
      monotonic_clock(std::move(monotonic_clock))
{
}

std::string SessionController::last_status_message() const {
    std::lock_guard<std::mutex> lock(status_mutex);
    return last_status;
}

void SessionController::emit_status(const std::string& message, bool force) {
    {
        std::lock_guard<std::mutex> lock(status_mutex);
        if (!force && message == last_status) return;
        last_status = message;
    }
    spdlog::debug("[Session] {}", message);
    if (status_cb) status_cb(message);
}

void SessionController::emit_log(const std::string& name, const std::string& time_str) {
    if (log_cb) log_cb(name, time_str);
}

// ==================== RUN ====================

SessionOutcome SessionController::run() {
    if (current_state.load() == SessionState::Running) {
        throw SessionError("A session is already running on this controller");
    }
    if (!source.claim()) {
        throw SessionError("Frame source " + source.name() + " is in use by another session");
    }

    std::map<int, std::string> identities;
    try {
        identities = ledger.identity_map();
    } catch (const LedgerError& e) {
        source.unclaim();
        throw SessionError(std::string("Attendance store unavailable: ") + e.what());
    }
    if (identities.empty()) {
        source.unclaim();
        throw SessionError("No enrolled identities. Enroll, then train, then retry.");
    }
    if (!analyzer.is_ready()) {
        source.unclaim();
        std::string reason = analyzer.not_ready_reason();
        throw SessionError(reason.empty()
            ? "Face model not available. Enroll, then train, then retry."
            : reason);
    }

    SourceLease lease(source);
    SessionOutcome outcome;

    {
        std::lock_guard<std::mutex> lock(status_mutex);
        last_status.clear();
    }
    current_state = SessionState::Running;

    spdlog::info("Session started on {} ({} identities, {}s, threshold {:.1f}, quorum {}/{})",
                 source.name(), identities.size(), opts.session_seconds, opts.threshold,
                 opts.stable_frames, opts.stable_window);

    if (!source.open()) {
        emit_status("Camera could not be opened. Exiting...");
        outcome.state = SessionState::Aborted;
    } else {
        emit_status("Camera online. Press ESC or Q to stop early.");

        std::set<int> known;
        for (const auto& kv : identities) known.insert(kv.first);
        TemporalStabilizer stabilizer(opts.stable_frames, opts.stable_window, known);

        const auto start_time = monotonic_clock();
        auto last_activity = start_time;
        bool hint_shown = false;

        outcome.state = SessionState::Completed;

        try {
            cv::Mat frame;
            while (true) {
                if (stop_requested.load()) {
                    emit_status("Capture stopped by user input.");
                    break;
                }

                auto now = monotonic_clock();
                if (std::chrono::duration<double>(now - start_time).count() >= opts.session_seconds) {
                    spdlog::info("Session duration reached ({}s)", opts.session_seconds);
                    break;
                }

                if (!source.read(frame)) {
                    emit_status("Camera feed unavailable. Exiting...");
                    outcome.state = SessionState::Aborted;
                    break;
                }
                outcome.frames++;

                auto detections = analyzer.analyze(frame);

                if (detections.empty()) {
                    double idle = std::chrono::duration<double>(now - last_activity).count();
                    if (opts.idle_hint_seconds > 0 && !outcome.logged && !hint_shown &&
                        idle > opts.idle_hint_seconds) {
                        emit_status("No log yet. Adjust pose or press Q to exit.");
                        hint_shown = true;
                    }
                    continue;
                }

                bool stop_now = false;
                for (const auto& det : detections) {
                    if (handle_detection(det, stabilizer, identities)) {
                        outcome.logged = true;
                        outcome.logs++;
                        last_activity = monotonic_clock();
                        hint_shown = false;
                        if (opts.stop_on_success) {
                            stop_now = true;
                            break;
                        }
                    }
                }

                if (stop_now) {
                    emit_status("Attendance logged. Closing camera...");
                    break;
                }
            }
        } catch (const LedgerError& e) {
            spdlog::error("Ledger failure during session: {}", e.what());
            emit_status("Attendance store error. Session stopped.");
            outcome.state = SessionState::Aborted;
        } catch (const cv::Exception& e) {
            spdlog::error("Frame processing failed: {}", e.what());
            emit_status("Camera processing error. Session stopped.");
            outcome.state = SessionState::Aborted;
        } catch (const std::exception& e) {
            spdlog::error("Session failed: {}", e.what());
            emit_status("Session error. Session stopped.");
            outcome.state = SessionState::Aborted;
        }
    }

    if (outcome.logged) {
        emit_status("Camera session finished. Log saved.", true);
    } else {
        emit_status("Camera session finished.", true);
    }

    current_state = outcome.state;
    stop_requested = false;
    outcome.last_status = last_status_message();

    spdlog::info("Session {}: {} frames, {} logs",
                 session_state_to_string(outcome.state), outcome.frames, outcome.logs);
    return outcome;
}

// ==================== DECISION GATE ====================

bool SessionController::handle_detection(const Detection& det,
                                         TemporalStabilizer& stabilizer,
                                         const std::map<int, std::string>& identities)
{
    double quality = match_quality(det.distance, opts.threshold);
    spdlog::debug("[Session] face label={} distance={:.1f} quality={:.0f}%",
                  det.label, det.distance, quality);

    stabilizer.observe(det.label, det.distance);
    StableDecision decision = stabilizer.decide(det.label, det.distance);

    auto it = identities.find(decision.label);
    if (it == identities.end()) {
        emit_status("Unknown face. Enroll first or adjust lighting.");
        return false;
    }

    const std::string& name = it->second;

    if (decision.distance > opts.threshold) {
        double effective_quality = match_quality(decision.distance, opts.threshold);
        emit_status(fmt::format("{} detected (match {:.0f}%). Need clearer view to log.",
                                name, effective_quality));
        return false;
    }

    AttendanceLogResult result = ledger.log_attendance(decision.label, name, wall_clock(),
                                                       opts.min_minutes_between_logs,
                                                       opts.enforce_one_per_day);
    if (result.logged) {
        emit_log(name, result.time_str);
        emit_status(fmt::format("Logged {} @ {}", name, result.time_str), true);
        return true;
    }

    emit_status(fmt::format("{} already logged recently.", name));
    return false;
}
