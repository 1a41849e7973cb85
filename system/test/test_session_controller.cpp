// ============= test/test_session_controller.cpp =============
#include "database/attendance_ledger.hpp"
#include "session/session_controller.hpp"
#include "session/session_events.hpp"
#include "test_helpers.hpp"
#include "time_utils.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <functional>
#include <memory>
#include <stdexcept>
#include <thread>
#include <utility>
#include <vector>

namespace {

// Yields `frames` blank frames, then reports the feed as gone.
class FakeFrameSource : public FrameSource {
public:
    explicit FakeFrameSource(int frames, bool can_open = true)
        : remaining(frames), can_open(can_open) {}

    bool open() override {
        opened = can_open;
        return opened;
    }

    bool read(cv::Mat& frame) override {
        if (!opened || remaining <= 0) return false;
        remaining--;
        if (on_read) on_read();
        frame = cv::Mat::zeros(48, 64, CV_8UC3);
        return true;
    }

    void release() override {
        opened = false;
        releases++;
    }

    bool is_open() const override { return opened; }
    std::string name() const override { return "fake"; }

    int remaining;
    bool can_open;
    std::function<void()> on_read;
    bool opened = false;
    int releases = 0;
};

using Script = std::vector<std::vector<Detection>>;

// Plays back one detection list per frame; calls on_script_end once the list runs out.
class ScriptedAnalyzer : public FaceAnalyzer {
public:
    explicit ScriptedAnalyzer(Script script = Script())
        : script(std::move(script)) {}

    bool is_ready() const override { return ready; }
    std::string not_ready_reason() const override { return reason; }

    std::vector<Detection> analyze(const cv::Mat&) override {
        if (throw_on_frame >= 0 && calls == throw_on_frame) {
            calls++;
            throw std::runtime_error("classifier crashed");
        }
        if (calls < static_cast<int>(script.size())) {
            return script[calls++];
        }
        calls++;
        if (on_script_end) on_script_end();
        return {};
    }

    Script script;
    std::function<void()> on_script_end;
    bool ready = true;
    std::string reason;
    int throw_on_frame = -1;
    int calls = 0;
};

Detection face(int label, double distance) {
    Detection d;
    d.box = cv::Rect(10, 10, 20, 20);
    d.label = label;
    d.distance = distance;
    return d;
}

Script repeat(const Detection& d, int frames) {
    return Script(frames, std::vector<Detection>{d});
}

} // namespace

class SessionControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ledger = std::make_unique<AttendanceLedger>(dir.file("attendance.sqlite3"));
        ledger->upsert_user(1, "Ana");

        opts.session_seconds = 3600;
        opts.threshold = 90.0;
        opts.stable_frames = 4;
        opts.stable_window = 8;
        opts.stop_on_success = false;
        opts.idle_hint_seconds = 0;
        opts.min_minutes_between_logs = 10;
        opts.enforce_one_per_day = true;
    }

    std::unique_ptr<SessionController> make(FaceAnalyzer& analyzer, FrameSource& source) {
        auto c = std::make_unique<SessionController>(*ledger, analyzer, source, opts,
                                                     [this]() { return now; },
                                                     [this]() { return mono; });
        c->set_status_callback([this](const std::string& m) { statuses.push_back(m); });
        c->set_log_callback([this](const std::string& n, const std::string& t) {
            logs.emplace_back(n, t);
        });
        return c;
    }

    int count_status(const std::string& m) const {
        return static_cast<int>(std::count(statuses.begin(), statuses.end(), m));
    }

    TempDir dir;
    std::unique_ptr<AttendanceLedger> ledger;
    SessionOptions opts;
    TimeUtils::TimePoint now = TimeUtils::make_local(2025, 3, 4, 9, 0, 0);
    std::chrono::steady_clock::time_point mono{};
    std::vector<std::string> statuses;
    std::vector<std::pair<std::string, std::string>> logs;
};

// ==================== HAPPY PATH ====================

TEST_F(SessionControllerTest, RecognizedFaceIsLoggedOnce) {
    FakeFrameSource source(100);
    ScriptedAnalyzer analyzer(repeat(face(1, 20.0), 4));
    auto session = make(analyzer, source);
    analyzer.on_script_end = [&session]() { session->request_stop(); };

    SessionOutcome out = session->run();

    EXPECT_EQ(out.state, SessionState::Completed);
    EXPECT_TRUE(out.logged);
    EXPECT_EQ(out.logs, 1);
    EXPECT_EQ(ledger->count_events(), 1);

    ASSERT_EQ(logs.size(), 1u);
    EXPECT_EQ(logs[0].first, "Ana");
    EXPECT_EQ(logs[0].second, "09:00:00");

    EXPECT_EQ(count_status("Logged Ana @ 09:00:00"), 1);
    EXPECT_EQ(count_status("Ana already logged recently."), 1);
    EXPECT_EQ(statuses.back(), "Camera session finished. Log saved.");
    EXPECT_EQ(out.last_status, "Camera session finished. Log saved.");

    // Same simulated day: the ledger refuses a second entry.
    auto again = ledger->log_attendance(1, "Ana", now + std::chrono::minutes(1));
    EXPECT_FALSE(again.logged);
}

TEST_F(SessionControllerTest, StopOnSuccessEndsAfterFirstLog) {
    opts.stop_on_success = true;
    FakeFrameSource source(100);
    ScriptedAnalyzer analyzer(repeat(face(1, 20.0), 10));
    auto session = make(analyzer, source);

    SessionOutcome out = session->run();

    EXPECT_EQ(out.state, SessionState::Completed);
    EXPECT_EQ(out.frames, 1);
    EXPECT_EQ(out.logs, 1);
    EXPECT_EQ(count_status("Attendance logged. Closing camera..."), 1);
    EXPECT_EQ(statuses.back(), "Camera session finished. Log saved.");
    EXPECT_EQ(source.releases, 1);
    EXPECT_FALSE(source.is_claimed());
    EXPECT_EQ(session->state(), SessionState::Completed);
}

TEST_F(SessionControllerTest, SecondSessionSameDayDoesNotLog) {
    opts.stop_on_success = true;
    {
        FakeFrameSource source(10);
        ScriptedAnalyzer analyzer(repeat(face(1, 20.0), 1));
        auto session = make(analyzer, source);
        ASSERT_TRUE(session->run().logged);
    }
    statuses.clear();
    logs.clear();
    now += std::chrono::hours(2);

    FakeFrameSource source(3);
    ScriptedAnalyzer analyzer(repeat(face(1, 20.0), 3));
    auto session = make(analyzer, source);
    SessionOutcome out = session->run();

    EXPECT_FALSE(out.logged);
    EXPECT_TRUE(logs.empty());
    EXPECT_EQ(ledger->count_events(), 1);
    EXPECT_EQ(statuses.back(), "Camera session finished.");
}

// ==================== DECISION GATE ====================

TEST_F(SessionControllerTest, WeakMatchNeedsClearerView) {
    opts.threshold = 50.0;
    FakeFrameSource source(100);
    ScriptedAnalyzer analyzer(repeat(face(1, 100.0), 2));
    auto session = make(analyzer, source);
    analyzer.on_script_end = [&session]() { session->request_stop(); };

    SessionOutcome out = session->run();

    EXPECT_FALSE(out.logged);
    EXPECT_EQ(ledger->count_events(), 0);
    EXPECT_EQ(count_status("Ana detected (match 25%). Need clearer view to log."), 1);
    EXPECT_EQ(count_status("Capture stopped by user input."), 1);
    EXPECT_EQ(statuses.back(), "Camera session finished.");
}

TEST_F(SessionControllerTest, UnknownFaceAsksForEnrollment) {
    FakeFrameSource source(100);
    Script script = {{face(UNKNOWN_LABEL, 140.0)}, {face(42, 10.0)}};
    ScriptedAnalyzer analyzer(script);
    auto session = make(analyzer, source);
    analyzer.on_script_end = [&session]() { session->request_stop(); };

    SessionOutcome out = session->run();

    EXPECT_FALSE(out.logged);
    EXPECT_EQ(ledger->count_events(), 0);
    EXPECT_EQ(count_status("Unknown face. Enroll first or adjust lighting."), 1);
}

TEST_F(SessionControllerTest, StabilizerOutvotesSingleMisread) {
    opts.stable_frames = 3;
    opts.stable_window = 5;
    ledger->upsert_user(2, "Bruno");

    // Three weak frames of Ana build quorum; Bruno's lone strong frame is outvoted.
    opts.threshold = 50.0;
    FakeFrameSource source(100);
    Script script = {{face(1, 80.0)}, {face(1, 80.0)}, {face(1, 80.0)}, {face(2, 5.0)}};
    ScriptedAnalyzer analyzer(script);
    auto session = make(analyzer, source);
    analyzer.on_script_end = [&session]() { session->request_stop(); };

    session->run();

    EXPECT_TRUE(logs.empty());
    EXPECT_EQ(ledger->count_events(), 0);
}

// ==================== TERMINATION ====================

TEST_F(SessionControllerTest, FeedLossAborts) {
    FakeFrameSource source(2);
    ScriptedAnalyzer analyzer;
    auto session = make(analyzer, source);

    SessionOutcome out = session->run();

    EXPECT_EQ(out.state, SessionState::Aborted);
    EXPECT_EQ(out.frames, 2);
    EXPECT_EQ(count_status("Camera feed unavailable. Exiting..."), 1);
    EXPECT_EQ(statuses.back(), "Camera session finished.");
    EXPECT_EQ(source.releases, 1);
    EXPECT_FALSE(source.is_claimed());
}

TEST_F(SessionControllerTest, OpenFailureAborts) {
    FakeFrameSource source(10, false);
    ScriptedAnalyzer analyzer;
    auto session = make(analyzer, source);

    SessionOutcome out = session->run();

    EXPECT_EQ(out.state, SessionState::Aborted);
    EXPECT_EQ(out.frames, 0);
    EXPECT_EQ(count_status("Camera could not be opened. Exiting..."), 1);
    EXPECT_FALSE(source.is_claimed());
}

TEST_F(SessionControllerTest, AnalyzerFailureAborts) {
    FakeFrameSource source(100);
    ScriptedAnalyzer analyzer(repeat(face(1, 20.0), 5));
    analyzer.throw_on_frame = 0;
    auto session = make(analyzer, source);

    SessionOutcome out = session->run();

    EXPECT_EQ(out.state, SessionState::Aborted);
    EXPECT_EQ(session->state(), SessionState::Aborted);
    EXPECT_EQ(source.releases, 1);
    EXPECT_EQ(statuses.back(), "Camera session finished.");
}

TEST_F(SessionControllerTest, DurationElapsedCompletes) {
    opts.session_seconds = 10;
    FakeFrameSource source(1000);
    source.on_read = [this]() { mono += std::chrono::seconds(1); };
    ScriptedAnalyzer analyzer;
    auto session = make(analyzer, source);

    SessionOutcome out = session->run();

    EXPECT_EQ(out.state, SessionState::Completed);
    EXPECT_EQ(out.frames, 10);
    EXPECT_FALSE(out.logged);
    EXPECT_EQ(statuses.back(), "Camera session finished.");
    EXPECT_EQ(source.releases, 1);
}

TEST_F(SessionControllerTest, IdleHintShownOnceAfterQuietPeriod) {
    opts.session_seconds = 20;
    opts.idle_hint_seconds = 3;
    FakeFrameSource source(1000);
    source.on_read = [this]() { mono += std::chrono::seconds(1); };
    ScriptedAnalyzer analyzer;
    auto session = make(analyzer, source);

    SessionOutcome out = session->run();

    EXPECT_EQ(out.state, SessionState::Completed);
    EXPECT_EQ(count_status("No log yet. Adjust pose or press Q to exit."), 1);
    EXPECT_EQ(statuses.back(), "Camera session finished.");
}

TEST_F(SessionControllerTest, NoIdleHintBeforeQuietPeriod) {
    opts.session_seconds = 3;
    opts.idle_hint_seconds = 5;
    FakeFrameSource source(1000);
    source.on_read = [this]() { mono += std::chrono::seconds(1); };
    ScriptedAnalyzer analyzer;
    auto session = make(analyzer, source);

    session->run();

    EXPECT_EQ(count_status("No log yet. Adjust pose or press Q to exit."), 0);
}

TEST_F(SessionControllerTest, StopRequestedBeforeRunIsHonored) {
    FakeFrameSource source(100);
    ScriptedAnalyzer analyzer(repeat(face(1, 20.0), 10));
    auto session = make(analyzer, source);

    session->request_stop();
    SessionOutcome out = session->run();

    EXPECT_EQ(out.state, SessionState::Completed);
    EXPECT_EQ(out.frames, 0);
    EXPECT_EQ(count_status("Capture stopped by user input."), 1);
    EXPECT_EQ(ledger->count_events(), 0);

    // The request is consumed; the next run captures normally.
    analyzer.on_script_end = [&session]() { session->request_stop(); };
    SessionOutcome second = session->run();
    EXPECT_EQ(second.state, SessionState::Completed);
    EXPECT_EQ(second.frames, 11);
    EXPECT_TRUE(second.logged);
    EXPECT_EQ(ledger->count_events(), 1);
}

// ==================== PRECONDITIONS ====================

TEST_F(SessionControllerTest, NoIdentitiesRefusesToStart) {
    ledger->delete_user(1);
    FakeFrameSource source(10);
    ScriptedAnalyzer analyzer;
    auto session = make(analyzer, source);

    EXPECT_THROW(session->run(), SessionError);
    EXPECT_EQ(session->state(), SessionState::Idle);
    EXPECT_FALSE(source.is_claimed());
    EXPECT_EQ(source.releases, 0);
}

TEST_F(SessionControllerTest, AnalyzerNotReadyRefusesToStart) {
    FakeFrameSource source(10);
    ScriptedAnalyzer analyzer;
    analyzer.ready = false;
    analyzer.reason = "Trained model not found";
    auto session = make(analyzer, source);

    try {
        session->run();
        FAIL() << "expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_STREQ(e.what(), "Trained model not found");
    }
    EXPECT_FALSE(source.is_claimed());
}

TEST_F(SessionControllerTest, ClaimedSourceIsRefused) {
    FakeFrameSource source(10);
    ASSERT_TRUE(source.claim());

    ScriptedAnalyzer analyzer;
    auto session = make(analyzer, source);

    EXPECT_THROW(session->run(), SessionError);
    EXPECT_TRUE(source.is_claimed());
    EXPECT_FALSE(source.opened);
}

// ==================== EVENT QUEUE ====================

TEST(SessionEventQueue, KeepsOrderAcrossThreads) {
    SessionEventQueue queue;
    auto status = queue.status_callback();
    auto log = queue.log_callback();

    std::thread producer([&]() {
        status("Camera online. Press ESC or Q to stop early.");
        log("Ana", "09:00:00");
        status("Camera session finished. Log saved.");
    });
    producer.join();

    SessionEvent ev;
    ASSERT_TRUE(queue.pop(ev, 100));
    EXPECT_EQ(ev.type, SessionEvent::Type::Status);

    ASSERT_TRUE(queue.pop(ev, 100));
    EXPECT_EQ(ev.type, SessionEvent::Type::Log);
    EXPECT_EQ(ev.name, "Ana");
    EXPECT_EQ(ev.time_str, "09:00:00");

    ASSERT_TRUE(queue.pop(ev, 100));
    EXPECT_EQ(ev.message, "Camera session finished. Log saved.");

    EXPECT_FALSE(queue.pop(ev, 10));
    EXPECT_EQ(queue.size(), 0u);
}
