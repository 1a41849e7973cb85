// ============= include/database/enrollment_requests.hpp =============
/*
 * Enrollment requests submitted at the kiosk, reviewed by an admin.
 * Lives in the same SQLite file as the attendance ledger.
 *
 * TABLE: enrollment_requests
 * ├── request_id (INTEGER PRIMARY KEY AUTOINCREMENT)
 * ├── name, contact, message (TEXT NOT NULL)
 * ├── timestamp (TEXT) - "2025-03-04 09:15:00"
 * └── status (TEXT) - "Pending" on creation
 */

#pragma once
#include "database/attendance_ledger.hpp"
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

struct EnrollmentRequest {
    int request_id;
    std::string name;
    std::string contact;
    std::string message;
    std::string timestamp;
    std::string status;
};

class EnrollmentRequestStore {
public:
    static constexpr const char* STATUS_PENDING = "Pending";

    explicit EnrollmentRequestStore(const std::string& db_path);
    ~EnrollmentRequestStore();

    EnrollmentRequestStore(const EnrollmentRequestStore&) = delete;
    EnrollmentRequestStore& operator=(const EnrollmentRequestStore&) = delete;

    // Fields are trimmed; each must be non-empty (std::invalid_argument).
    int add_request(const std::string& name, const std::string& contact,
                    const std::string& message);

    // Empty status or unknown id -> std::invalid_argument, nothing changed.
    void update_status(int request_id, const std::string& status);

    std::vector<EnrollmentRequest> list_requests();

private:
    sqlite3* db;
    std::string db_path;
    std::mutex db_mutex;
};
