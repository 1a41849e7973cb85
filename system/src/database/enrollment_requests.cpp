// ============= src/database/enrollment_requests.cpp =============
#include "database/enrollment_requests.hpp"
#include "database/sqlite_helpers.hpp"
#include "time_utils.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

using SqliteHelpers::column_text;
using SqliteHelpers::trim;

namespace {

SqliteHelpers::StmtPtr prepare(sqlite3* db, const char* sql) {
    return SqliteHelpers::prepare<LedgerError>(db, sql);
}

} // namespace

EnrollmentRequestStore::EnrollmentRequestStore(const std::string& db_path)
    : db(nullptr), db_path(db_path)
{
    std::filesystem::path p(db_path);
    if (p.has_parent_path()) {
        std::filesystem::create_directories(p.parent_path());
    }

    if (sqlite3_open(db_path.c_str(), &db) != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        db = nullptr;
        throw LedgerError("Cannot open request database: " + msg);
    }
    sqlite3_busy_timeout(db, Config::DB_BUSY_TIMEOUT_MS);

    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS enrollment_requests (
            request_id INTEGER PRIMARY KEY AUTOINCREMENT,
            name       TEXT NOT NULL,
            contact    TEXT NOT NULL,
            message    TEXT NOT NULL,
            timestamp  TEXT NOT NULL,
            status     TEXT NOT NULL
        );
    )";

    char* err_msg = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &err_msg) != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errmsg(db);
        sqlite3_free(err_msg);
        sqlite3_close(db);
        db = nullptr;
        spdlog::error("Error creating enrollment_requests: {}", msg);
        throw LedgerError("Cannot create enrollment_requests: " + msg);
    }
}

EnrollmentRequestStore::~EnrollmentRequestStore() {
    if (db) sqlite3_close(db);
}

int EnrollmentRequestStore::add_request(const std::string& name, const std::string& contact,
                                        const std::string& message)
{
    const std::string n = trim(name);
    const std::string c = trim(contact);
    const std::string m = trim(message);
    if (n.empty()) throw std::invalid_argument("Name is required.");
    if (c.empty()) throw std::invalid_argument("Contact info is required.");
    if (m.empty()) throw std::invalid_argument("Please describe your request.");

    const std::string ts = TimeUtils::format_timestamp(TimeUtils::Clock::now());

    std::lock_guard<std::mutex> lock(db_mutex);
    auto stmt = prepare(db,
        "INSERT INTO enrollment_requests (name, contact, message, timestamp, status) "
        "VALUES (?, ?, ?, ?, ?)");
    sqlite3_bind_text(stmt.get(), 1, n.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, c.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 3, m.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 4, ts.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 5, STATUS_PENDING, -1, SQLITE_STATIC);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw LedgerError(std::string("Cannot add request: ") + sqlite3_errmsg(db));
    }

    int id = static_cast<int>(sqlite3_last_insert_rowid(db));
    spdlog::info("Enrollment request #{} from {}", id, n);
    return id;
}

void EnrollmentRequestStore::update_status(int request_id, const std::string& status) {
    const std::string s = trim(status);
    if (s.empty()) throw std::invalid_argument("Status cannot be empty");

    std::lock_guard<std::mutex> lock(db_mutex);
    auto stmt = prepare(db, "UPDATE enrollment_requests SET status = ? WHERE request_id = ?");
    sqlite3_bind_text(stmt.get(), 1, s.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt.get(), 2, request_id);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw LedgerError(std::string("Cannot update request: ") + sqlite3_errmsg(db));
    }
    if (sqlite3_changes(db) == 0) {
        throw std::invalid_argument("Request ID " + std::to_string(request_id) + " not found.");
    }
    spdlog::info("Enrollment request #{} -> {}", request_id, s);
}

std::vector<EnrollmentRequest> EnrollmentRequestStore::list_requests() {
    std::lock_guard<std::mutex> lock(db_mutex);
    auto stmt = prepare(db,
        "SELECT request_id, name, contact, message, timestamp, status "
        "FROM enrollment_requests ORDER BY request_id");

    std::vector<EnrollmentRequest> out;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        EnrollmentRequest r;
        r.request_id = sqlite3_column_int(stmt.get(), 0);
        r.name = column_text(stmt.get(), 1);
        r.contact = column_text(stmt.get(), 2);
        r.message = column_text(stmt.get(), 3);
        r.timestamp = column_text(stmt.get(), 4);
        r.status = column_text(stmt.get(), 5);
        out.push_back(r);
    }
    if (rc != SQLITE_DONE) {
        throw LedgerError(std::string("Cannot list requests: ") + sqlite3_errmsg(db));
    }
    return out;
}
