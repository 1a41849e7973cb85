// ============= src/database/attendance_ledger.cpp =============
#include "database/attendance_ledger.hpp"
#include "database/sqlite_helpers.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

using SqliteHelpers::StmtPtr;
using SqliteHelpers::column_text;

namespace {

StmtPtr prepare(sqlite3* db, const char* sql) {
    return SqliteHelpers::prepare<LedgerError>(db, sql);
}

// BEGIN IMMEDIATE takes the write lock up front; rolls back unless committed.
class WriteTransaction {
public:
    explicit WriteTransaction(sqlite3* db) : db(db) {
        char* err_msg = nullptr;
        if (sqlite3_exec(db, "BEGIN IMMEDIATE", nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::string msg = err_msg ? err_msg : sqlite3_errmsg(db);
            sqlite3_free(err_msg);
            throw LedgerError("Cannot begin transaction: " + msg);
        }
    }

    ~WriteTransaction() {
        if (!finished) {
            if (sqlite3_exec(db, "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
                spdlog::error("Rollback failed: {}", sqlite3_errmsg(db));
            }
        }
    }

    void commit() {
        if (sqlite3_exec(db, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK) {
            throw LedgerError(std::string("Commit failed: ") + sqlite3_errmsg(db));
        }
        finished = true;
    }

private:
    sqlite3* db;
    bool finished = false;
};

AttendanceEvent read_event(sqlite3_stmt* stmt) {
    AttendanceEvent e;
    e.row_id = sqlite3_column_int64(stmt, 0);
    e.user_id = sqlite3_column_int(stmt, 1);
    e.name = column_text(stmt, 2);
    e.timestamp = column_text(stmt, 3);
    e.date = column_text(stmt, 4);
    e.time = column_text(stmt, 5);
    return e;
}

std::string csv_field(const std::string& value) {
    if (value.find_first_of(",\"\n\r") == std::string::npos) return value;

    std::string out = "\"";
    for (char c : value) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

} // namespace

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

AttendanceLedger::AttendanceLedger(const std::string& db_path)
    : db(nullptr), db_path(db_path)
{
    std::filesystem::path p(db_path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        db = nullptr;
        throw LedgerError("Cannot open attendance database: " + msg);
    }

    sqlite3_busy_timeout(db, Config::DB_BUSY_TIMEOUT_MS);
    try {
        exec("PRAGMA journal_mode=WAL");
        exec("PRAGMA synchronous=NORMAL");
        exec("PRAGMA foreign_keys=ON");
        create_tables();
    } catch (const LedgerError&) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }

    spdlog::info("Attendance ledger ready");
    spdlog::info("   Database: {}", db_path);
}

AttendanceLedger::~AttendanceLedger() {
    if (db) {
        sqlite3_close(db);
        db = nullptr;
    }
}

// ==================== INITIALIZATION ====================

void AttendanceLedger::exec(const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errmsg(db);
        sqlite3_free(err_msg);
        spdlog::error("SQL error: {}", msg);
        throw LedgerError("SQL error: " + msg);
    }
}

void AttendanceLedger::create_tables() {
    exec(R"(
        CREATE TABLE IF NOT EXISTS users (
            id   INTEGER PRIMARY KEY,
            name TEXT NOT NULL
        );

        CREATE TABLE IF NOT EXISTS attendance (
            id      INTEGER PRIMARY KEY AUTOINCREMENT,
            user_id INTEGER NOT NULL,
            name    TEXT NOT NULL,
            ts      TEXT NOT NULL,
            date    TEXT NOT NULL,
            time    TEXT NOT NULL
        );

        CREATE INDEX IF NOT EXISTS idx_attendance_user_date ON attendance(user_id, date);
        CREATE INDEX IF NOT EXISTS idx_attendance_ts ON attendance(ts);
        CREATE UNIQUE INDEX IF NOT EXISTS uniq_attendance_user_ts ON attendance(user_id, ts);
    )");
}

// ==================== ATTENDANCE ====================

// Append order, not ts: a malformed ts must not sort ahead of newer rows.
std::optional<AttendanceEvent> AttendanceLedger::last_event_locked(int user_id) {
    auto stmt = prepare(db,
        "SELECT id, user_id, name, ts, date, time FROM attendance "
        "WHERE user_id = ? ORDER BY id DESC LIMIT 1");
    sqlite3_bind_int(stmt.get(), 1, user_id);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) return read_event(stmt.get());
    if (rc != SQLITE_DONE) {
        throw LedgerError(std::string("Cannot read last event: ") + sqlite3_errmsg(db));
    }
    return std::nullopt;
}

std::optional<AttendanceEvent> AttendanceLedger::last_event(int user_id) {
    std::lock_guard<std::mutex> lock(db_mutex);
    return last_event_locked(user_id);
}

AttendanceLogResult AttendanceLedger::log_attendance(int user_id,
                                                     const std::string& user_name,
                                                     TimeUtils::TimePoint now,
                                                     int min_minutes_between_logs,
                                                     bool enforce_one_per_day)
{
    const std::string date_str = TimeUtils::format_date(now);
    const std::string time_str = TimeUtils::format_time(now);
    const std::string ts_str = TimeUtils::format_timestamp(now);

    std::lock_guard<std::mutex> lock(db_mutex);
    WriteTransaction tx(db);

    auto last = last_event_locked(user_id);
    if (last) {
        if (enforce_one_per_day && last->date == date_str) {
            spdlog::debug("Suppressed {} (ID={}): already logged on {}", user_name, user_id, date_str);
            return {false, time_str};
        }

        if (min_minutes_between_logs > 0) {
            TimeUtils::TimePoint last_tp;
            if (TimeUtils::parse_timestamp(last->timestamp, last_tp)) {
                double delta_min = std::chrono::duration<double>(now - last_tp).count() / 60.0;
                if (delta_min < static_cast<double>(min_minutes_between_logs)) {
                    spdlog::debug("Suppressed {} (ID={}): {:.1f} min since last log (min {})",
                                  user_name, user_id, delta_min, min_minutes_between_logs);
                    return {false, time_str};
                }
            } else {
                spdlog::warn("Unparsable timestamp '{}' for user {} (row {}), allowing log",
                             last->timestamp, user_id, last->row_id);
            }
        }
    }

    auto stmt = prepare(db,
        "INSERT INTO attendance (user_id, name, ts, date, time) VALUES (?, ?, ?, ?, ?)");
    sqlite3_bind_int(stmt.get(), 1, user_id);
    sqlite3_bind_text(stmt.get(), 2, user_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, ts_str.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 4, date_str.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 5, time_str.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt.get());
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        // Same identity, same second: duplicate guard.
        spdlog::warn("Duplicate attendance for ID={} at {} rejected", user_id, ts_str);
        return {false, time_str};
    }
    if (rc != SQLITE_DONE) {
        spdlog::error("Error inserting attendance: {}", sqlite3_errmsg(db));
        throw LedgerError(std::string("Insert failed: ") + sqlite3_errmsg(db));
    }

    stmt.reset();
    tx.commit();

    spdlog::info("Attendance logged: {} (ID={}) @ {}", user_name, user_id, ts_str);
    return {true, time_str};
}

std::vector<AttendanceEvent> AttendanceLedger::select_events(const char* sql, const std::string* param) {
    std::lock_guard<std::mutex> lock(db_mutex);

    auto stmt = prepare(db, sql);
    if (param) {
        sqlite3_bind_text(stmt.get(), 1, param->c_str(), -1, SQLITE_TRANSIENT);
    }

    std::vector<AttendanceEvent> events;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        events.push_back(read_event(stmt.get()));
    }
    if (rc != SQLITE_DONE) {
        throw LedgerError(std::string("Query failed: ") + sqlite3_errmsg(db));
    }
    return events;
}

std::vector<AttendanceEvent> AttendanceLedger::query_window(TimeUtils::TimePoint start) {
    const std::string start_str = TimeUtils::format_timestamp(start);
    return select_events(
        "SELECT id, user_id, name, ts, date, time FROM attendance "
        "WHERE ts >= ? ORDER BY ts ASC, id ASC", &start_str);
}

std::vector<AttendanceEvent> AttendanceLedger::all_events() {
    return select_events(
        "SELECT id, user_id, name, ts, date, time FROM attendance "
        "ORDER BY date, time, id", nullptr);
}

int AttendanceLedger::count_events() {
    std::lock_guard<std::mutex> lock(db_mutex);
    auto stmt = prepare(db, "SELECT COUNT(*) FROM attendance");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw LedgerError(std::string("Count failed: ") + sqlite3_errmsg(db));
    }
    return sqlite3_column_int(stmt.get(), 0);
}

TimeUtils::TimePoint AttendanceLedger::period_start(const std::string& period, TimeUtils::TimePoint now) {
    std::string p = SqliteHelpers::trim(period);
    std::transform(p.begin(), p.end(), p.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (p.empty()) p = Config::PERIOD_DAILY;

    if (p == Config::PERIOD_DAILY) return TimeUtils::start_of_day(now);
    if (p == Config::PERIOD_WEEKLY) return TimeUtils::start_of_week(now);
    if (p == Config::PERIOD_MONTHLY) return TimeUtils::start_of_month(now);

    throw std::invalid_argument("period must be one of: daily, weekly, monthly");
}

size_t AttendanceLedger::export_csv(const std::string& out_path, const std::string& period,
                                    TimeUtils::TimePoint now)
{
    auto start = period_start(period, now);
    auto events = query_window(start);

    std::filesystem::path p(out_path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    std::ofstream out(out_path, std::ios::trunc);
    if (!out.is_open()) {
        throw LedgerError("Cannot write export file: " + out_path);
    }

    out << "Id,Name,Date,Time\n";
    for (const auto& e : events) {
        out << e.user_id << ',' << csv_field(e.name) << ',' << e.date << ',' << e.time << '\n';
    }
    out.flush();
    if (!out) {
        throw LedgerError("Error writing export file: " + out_path);
    }

    spdlog::info("Exported {} attendance rows ({}) to {}", events.size(), period, out_path);
    return events.size();
}

// ==================== IDENTITIES ====================

void AttendanceLedger::upsert_user(int user_id, const std::string& name) {
    std::string clean = SqliteHelpers::trim(name);
    if (clean.empty()) {
        throw std::invalid_argument("Name cannot be empty");
    }
    if (user_id < 0) {
        throw std::invalid_argument("User ID must be non-negative");
    }

    std::lock_guard<std::mutex> lock(db_mutex);
    auto stmt = prepare(db,
        "INSERT INTO users (id, name) VALUES (?, ?) "
        "ON CONFLICT(id) DO UPDATE SET name = excluded.name");
    sqlite3_bind_int(stmt.get(), 1, user_id);
    sqlite3_bind_text(stmt.get(), 2, clean.c_str(), -1, SQLITE_TRANSIENT);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw LedgerError(std::string("Cannot save user: ") + sqlite3_errmsg(db));
    }
    spdlog::info("User saved: {} (ID={})", clean, user_id);
}

void AttendanceLedger::delete_user(int user_id) {
    std::lock_guard<std::mutex> lock(db_mutex);
    auto stmt = prepare(db, "DELETE FROM users WHERE id = ?");
    sqlite3_bind_int(stmt.get(), 1, user_id);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw LedgerError(std::string("Cannot delete user: ") + sqlite3_errmsg(db));
    }
    if (sqlite3_changes(db) == 0) {
        throw std::invalid_argument("User ID " + std::to_string(user_id) + " not found");
    }
    spdlog::info("User deleted: ID={}", user_id);
}

std::vector<UserRecord> AttendanceLedger::list_users() {
    std::lock_guard<std::mutex> lock(db_mutex);
    auto stmt = prepare(db, "SELECT id, name FROM users ORDER BY id");

    std::vector<UserRecord> users;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        users.push_back({sqlite3_column_int(stmt.get(), 0), column_text(stmt.get(), 1)});
    }
    if (rc != SQLITE_DONE) {
        throw LedgerError(std::string("Cannot list users: ") + sqlite3_errmsg(db));
    }
    return users;
}

std::optional<UserRecord> AttendanceLedger::find_user(int user_id) {
    std::lock_guard<std::mutex> lock(db_mutex);
    auto stmt = prepare(db, "SELECT id, name FROM users WHERE id = ?");
    sqlite3_bind_int(stmt.get(), 1, user_id);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return UserRecord{sqlite3_column_int(stmt.get(), 0), column_text(stmt.get(), 1)};
    }
    if (rc != SQLITE_DONE) {
        throw LedgerError(std::string("Cannot read user: ") + sqlite3_errmsg(db));
    }
    return std::nullopt;
}

std::map<int, std::string> AttendanceLedger::identity_map() {
    std::map<int, std::string> out;
    for (const auto& u : list_users()) {
        out[u.id] = u.name;
    }
    return out;
}

int AttendanceLedger::count_users() {
    std::lock_guard<std::mutex> lock(db_mutex);
    auto stmt = prepare(db, "SELECT COUNT(*) FROM users");
    if (sqlite3_step(stmt.get()) != SQLITE_ROW) {
        throw LedgerError(std::string("Count failed: ") + sqlite3_errmsg(db));
    }
    return sqlite3_column_int(stmt.get(), 0);
}
