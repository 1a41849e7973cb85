#pragma once
#include <memory>
#include <string>
#include <sqlite3.h>

namespace SqliteHelpers {

    using StmtPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

    // Throws ErrorT with the sqlite message when preparation fails.
    template<typename ErrorT>
    StmtPtr prepare(sqlite3* db, const char* sql) {
        sqlite3_stmt* raw = nullptr;
        if (sqlite3_prepare_v2(db, sql, -1, &raw, nullptr) != SQLITE_OK) {
            sqlite3_finalize(raw);
            throw ErrorT(std::string("prepare failed: ") + sqlite3_errmsg(db));
        }
        return StmtPtr(raw, &sqlite3_finalize);
    }

    inline std::string column_text(sqlite3_stmt* stmt, int col) {
        const unsigned char* txt = sqlite3_column_text(stmt, col);
        return txt ? reinterpret_cast<const char*>(txt) : "";
    }

    inline std::string trim(const std::string& s) {
        auto start = s.find_first_not_of(" \t\r\n");
        if (start == std::string::npos) return "";
        auto end = s.find_last_not_of(" \t\r\n");
        return s.substr(start, end - start + 1);
    }
}
