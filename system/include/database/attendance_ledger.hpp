// ============= include/database/attendance_ledger.hpp =============
/*
 * Attendance Ledger - SQLite Backend
 *
 * Append-only attendance events plus the identity registry they refer to.
 *
 * SCHEMA:
 * CREATE TABLE users (
 *   id   INTEGER PRIMARY KEY,
 *   name TEXT NOT NULL
 * );
 * CREATE TABLE attendance (
 *   id      INTEGER PRIMARY KEY AUTOINCREMENT,
 *   user_id INTEGER NOT NULL,
 *   name    TEXT NOT NULL,        -- name snapshot at log time
 *   ts      TEXT NOT NULL,        -- "2025-03-04 09:15:00"
 *   date    TEXT NOT NULL,        -- "2025-03-04"
 *   time    TEXT NOT NULL         -- "09:15:00"
 * );
 * CREATE INDEX idx_attendance_user_date ON attendance(user_id, date);
 * CREATE INDEX idx_attendance_ts ON attendance(ts);
 * CREATE UNIQUE INDEX uniq_attendance_user_ts ON attendance(user_id, ts);
 *
 * SUPPRESSION (checked against the identity's most recently appended event):
 * - one-per-day: latest event has today's date
 * - min interval: latest event is less than N minutes old
 *   (unparsable timestamp -> rule skipped, log allowed)
 *
 * CONCURRENCY:
 * - check + insert run in one BEGIN IMMEDIATE transaction, so kiosks
 *   sharing the file are serialized by SQLite's write lock
 * - in-process callers share one connection guarded by db_mutex
 * - users deleted here keep their historical rows
 */

#pragma once
#include "config.hpp"
#include "time_utils.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <sqlite3.h>

struct AttendanceEvent {
    int64_t row_id = 0;
    int user_id = 0;
    std::string name;
    std::string timestamp;
    std::string date;
    std::string time;
};

struct AttendanceLogResult {
    bool logged;
    std::string time_str;
};

struct UserRecord {
    int id;
    std::string name;
};

// Storage failure (open, prepare, step, commit). Suppression is not an error.
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(const std::string& what) : std::runtime_error(what) {}
};

class AttendanceLedger {
public:
    explicit AttendanceLedger(const std::string& db_path);
    ~AttendanceLedger();

    AttendanceLedger(const AttendanceLedger&) = delete;
    AttendanceLedger& operator=(const AttendanceLedger&) = delete;

    // ===== ATTENDANCE =====

    AttendanceLogResult log_attendance(int user_id,
                                       const std::string& user_name,
                                       TimeUtils::TimePoint now,
                                       int min_minutes_between_logs = Config::DEFAULT_MIN_MINUTES_BETWEEN_LOGS,
                                       bool enforce_one_per_day = Config::DEFAULT_ENFORCE_ONE_PER_DAY);

    std::optional<AttendanceEvent> last_event(int user_id);

    // Events with ts >= start, ascending.
    std::vector<AttendanceEvent> query_window(TimeUtils::TimePoint start);
    std::vector<AttendanceEvent> all_events();
    int count_events();

    // "daily" | "weekly" | "monthly" (case-insensitive); throws std::invalid_argument otherwise.
    static TimeUtils::TimePoint period_start(const std::string& period, TimeUtils::TimePoint now);

    // CSV with header Id,Name,Date,Time. Returns rows written.
    size_t export_csv(const std::string& out_path, const std::string& period,
                      TimeUtils::TimePoint now);

    // ===== IDENTITIES =====

    void upsert_user(int user_id, const std::string& name);
    void delete_user(int user_id);
    std::vector<UserRecord> list_users();
    std::optional<UserRecord> find_user(int user_id);
    std::map<int, std::string> identity_map();
    int count_users();

    std::string get_db_path() const { return db_path; }
    bool is_open() const { return db != nullptr; }

private:
    sqlite3* db;
    std::string db_path;
    mutable std::mutex db_mutex;

    void create_tables();
    void exec(const char* sql);
    std::optional<AttendanceEvent> last_event_locked(int user_id);
    std::vector<AttendanceEvent> select_events(const char* sql, const std::string* param);
};
