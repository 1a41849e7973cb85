// ============= tools/attendance_admin.cpp =============
/*
 * Admin tool for the attendance SQLite file
 *
 * EXAMPLES:
 *
  ./build/bin/attendance_admin data/attendance.sqlite3 --recent 5

 * ./attendance_admin attendance.sqlite3 --stats
 * ./attendance_admin attendance.sqlite3 --users
 * ./attendance_admin attendance.sqlite3 --add-user 1 "Ana Lima"
 * ./attendance_admin attendance.sqlite3 --export weekly week.csv
 * ./attendance_admin attendance.sqlite3 --requests
 * ./attendance_admin attendance.sqlite3 --set-request-status 3 Approved
 */

#include "database/attendance_ledger.hpp"
#include "database/enrollment_requests.hpp"
#include "settings.hpp"
#include "time_utils.hpp"
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>
#include <spdlog/spdlog.h>

namespace {

void show_statistics(AttendanceLedger& ledger) {
    auto now = TimeUtils::Clock::now();
    size_t today = ledger.query_window(TimeUtils::start_of_day(now)).size();
    size_t week = ledger.query_window(TimeUtils::start_of_week(now)).size();
    size_t month = ledger.query_window(TimeUtils::start_of_month(now)).size();

    std::cout << "\n═══════════════════════════════════════════════" << std::endl;
    std::cout << "   ATTENDANCE SUMMARY" << std::endl;
    std::cout << "═══════════════════════════════════════════════" << std::endl;
    std::cout << "Enrolled identities: " << ledger.count_users() << std::endl;
    std::cout << "Total events:        " << ledger.count_events() << std::endl;
    std::cout << "Today:               " << today << std::endl;
    std::cout << "This week:           " << week << std::endl;
    std::cout << "This month:          " << month << std::endl;
    std::cout << "═══════════════════════════════════════════════\n" << std::endl;
}

void print_users(const std::vector<UserRecord>& users) {
    if (users.empty()) {
        std::cout << "No enrolled identities." << std::endl;
        return;
    }

    std::cout << std::setw(8) << "ID" << "  " << "Name" << std::endl;
    std::cout << std::string(40, '-') << std::endl;
    for (const auto& u : users) {
        std::cout << std::setw(8) << u.id << "  " << u.name << std::endl;
    }
}

void print_events(const std::vector<AttendanceEvent>& events) {
    if (events.empty()) {
        std::cout << "No attendance events found." << std::endl;
        return;
    }

    std::cout << "\nFound " << events.size() << " events:\n" << std::endl;
    std::cout << std::setw(8) << "ID"
              << std::setw(12) << "Date"
              << std::setw(10) << "Time"
              << "  " << "Name"
              << std::endl;
    std::cout << std::string(60, '-') << std::endl;

    for (const auto& e : events) {
        std::cout << std::setw(8) << e.user_id
                  << std::setw(12) << e.date
                  << std::setw(10) << e.time
                  << "  " << e.name
                  << std::endl;
    }
}

void print_requests(const std::vector<EnrollmentRequest>& requests) {
    if (requests.empty()) {
        std::cout << "No enrollment requests." << std::endl;
        return;
    }

    for (const auto& r : requests) {
        std::cout << "#" << r.request_id << " [" << r.status << "] " << r.timestamp << "\n"
                  << "  Name:    " << r.name << "\n"
                  << "  Contact: " << r.contact << "\n"
                  << "  Message: " << r.message << "\n" << std::endl;
    }
}

void print_usage(const char* prog) {
    std::cout << "USAGE: " << prog << " <database.sqlite3> [options]\n\n";
    std::cout << "OPTIONS:\n";
    std::cout << "  --config FILE.toml               Settings file (default config.toml)\n";
    std::cout << "  --stats                          Event counts per period\n";
    std::cout << "  --recent N                       Last N attendance events\n";
    std::cout << "  --users                          List enrolled identities\n";
    std::cout << "  --add-user ID NAME               Register or rename an identity\n";
    std::cout << "  --delete-user ID                 Remove an identity (history kept)\n";
    std::cout << "  --export PERIOD FILE.csv         PERIOD: daily | weekly | monthly\n";
    std::cout << "  --requests                       List enrollment requests\n";
    std::cout << "  --add-request NAME CONTACT MSG   File an enrollment request\n";
    std::cout << "  --set-request-status ID STATUS   Update a request status\n";
    std::cout << "\nEXAMPLES:\n";
    std::cout << "  " << prog << " attendance.sqlite3 --stats\n";
    std::cout << "  " << prog << " attendance.sqlite3 --recent 20\n";
    std::cout << "  " << prog << " attendance.sqlite3 --export monthly march.csv\n";
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        // Settings first, so the privacy gate holds wherever --config appears.
        std::string config_file = Config::DEFAULT_CONFIG_FILE;
        for (int i = 2; i + 1 < argc; i++) {
            if (std::string(argv[i]) == "--config") config_file = argv[i + 1];
        }
        Settings settings = load_settings(config_file);

        AttendanceLedger ledger(argv[1]);

        for (int i = 2; i < argc; i++) {
            std::string arg = argv[i];

            if (arg == "--config" && i + 1 < argc) {
                ++i;
            }
            else if (arg == "--stats") {
                show_statistics(ledger);
            }
            else if (arg == "--recent" && i + 1 < argc) {
                int limit = std::stoi(argv[++i]);
                auto events = ledger.all_events();
                if (limit >= 0 && events.size() > static_cast<size_t>(limit)) {
                    events.erase(events.begin(), events.end() - limit);
                }
                print_events(events);
            }
            else if (arg == "--users") {
                print_users(ledger.list_users());
            }
            else if (arg == "--add-user" && i + 2 < argc) {
                if (settings.privacy_mode) {
                    spdlog::error("Enrollment is disabled while privacy mode is on.");
                    return 1;
                }
                int user_id = std::stoi(argv[++i]);
                std::string name = argv[++i];
                ledger.upsert_user(user_id, name);
                std::cout << "Saved identity " << user_id << " (" << name << ")" << std::endl;
            }
            else if (arg == "--delete-user" && i + 1 < argc) {
                int user_id = std::stoi(argv[++i]);
                ledger.delete_user(user_id);
                std::cout << "Deleted identity " << user_id << std::endl;
            }
            else if (arg == "--export" && i + 2 < argc) {
                std::string period = argv[++i];
                std::string out_path = argv[++i];
                size_t rows = ledger.export_csv(out_path, period, TimeUtils::Clock::now());
                std::cout << "Exported " << rows << " rows to: " << out_path << std::endl;
            }
            else if (arg == "--requests") {
                EnrollmentRequestStore store(argv[1]);
                print_requests(store.list_requests());
            }
            else if (arg == "--add-request" && i + 3 < argc) {
                EnrollmentRequestStore store(argv[1]);
                std::string name = argv[++i];
                std::string contact = argv[++i];
                std::string message = argv[++i];
                int id = store.add_request(name, contact, message);
                std::cout << "Request #" << id << " submitted." << std::endl;
            }
            else if (arg == "--set-request-status" && i + 2 < argc) {
                EnrollmentRequestStore store(argv[1]);
                int request_id = std::stoi(argv[++i]);
                std::string status = argv[++i];
                store.update_status(request_id, status);
                std::cout << "Request #" << request_id << " -> " << status << std::endl;
            }
            else {
                std::cerr << "Unknown or incomplete option: " << arg << "\n" << std::endl;
                print_usage(argv[0]);
                return 1;
            }
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
