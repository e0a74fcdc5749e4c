#include "database.h"
#include "call-dispatcher.h"
#include <iostream>
#include <chrono>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <cstdlib>
#include <ctime>

Database::Database() : db_(nullptr) {}

Database::~Database() {
    close();
}

std::string Database::default_path() {
    const char* data_home = std::getenv("XDG_DATA_HOME");
    std::string base;
    if (data_home && *data_home) {
        base = data_home;
    } else {
        const char* home = std::getenv("HOME");
        base = (home && *home) ? std::string(home) + "/.local/share" : std::string(".");
    }
    return base + "/click-to-call/history.db";
}

bool Database::init(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(db_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::cerr << "Cannot open database: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Enable WAL mode for better performance
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }
    return true;
}

void Database::close() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool Database::create_tables() {
    const char* calls_sql = R"(
        CREATE TABLE IF NOT EXISTS calls (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            created_at TEXT NOT NULL,
            phone_number TEXT NOT NULL,
            extension TEXT NOT NULL,
            domain TEXT NOT NULL,
            outcome TEXT NOT NULL,
            http_status INTEGER DEFAULT 0,
            message TEXT DEFAULT ''
        );
        CREATE INDEX IF NOT EXISTS idx_calls_phone_number ON calls(phone_number);
    )";

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, calls_sql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error creating calls table: " << err_msg << std::endl;
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

bool Database::record_call(const CallRequest& request, const CallOutcome& outcome,
                           const std::string& message) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    const char* sql = "INSERT INTO calls (created_at, phone_number, extension, domain, outcome, http_status, message) "
                      "VALUES (?, ?, ?, ?, ?, ?, ?)";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        std::cerr << "❌ Failed to prepare call history insert: " << sqlite3_errmsg(db_) << std::endl;
        sqlite3_finalize(stmt);
        return false;
    }

    std::string timestamp = get_current_timestamp();
    sqlite3_bind_text(stmt, 1, timestamp.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, request.phone_number.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 3, request.extension.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 4, request.domain.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, outcome_kind_name(outcome.kind), -1, SQLITE_STATIC);
    sqlite3_bind_int(stmt, 6, outcome.status_code);
    sqlite3_bind_text(stmt, 7, message.c_str(), -1, SQLITE_TRANSIENT);

    bool success = sqlite3_step(stmt) == SQLITE_DONE;
    if (!success) {
        std::cerr << "❌ Failed to record call: " << sqlite3_errmsg(db_) << std::endl;
    }
    sqlite3_finalize(stmt);
    return success;
}

std::vector<CallRecord> Database::get_recent_calls(int limit) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    std::vector<CallRecord> records;
    if (!db_) return records;

    const char* sql = "SELECT id, created_at, phone_number, extension, domain, outcome, http_status, message "
                      "FROM calls ORDER BY id DESC LIMIT ?";
    sqlite3_stmt* stmt = nullptr;

    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) == SQLITE_OK) {
        sqlite3_bind_int(stmt, 1, limit);

        while (sqlite3_step(stmt) == SQLITE_ROW) {
            CallRecord record;
            record.id = sqlite3_column_int(stmt, 0);
            auto text = [stmt](int col) {
                const unsigned char* value = sqlite3_column_text(stmt, col);
                return value ? std::string(reinterpret_cast<const char*>(value)) : std::string();
            };
            record.created_at = text(1);
            record.phone_number = text(2);
            record.extension = text(3);
            record.domain = text(4);
            record.outcome = text(5);
            record.http_status = sqlite3_column_int(stmt, 6);
            record.message = text(7);
            records.push_back(record);
        }
    }
    sqlite3_finalize(stmt);
    return records;
}

int Database::count_calls() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    int count = 0;
    if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM calls", -1, &stmt, nullptr) == SQLITE_OK) {
        if (sqlite3_step(stmt) == SQLITE_ROW) {
            count = sqlite3_column_int(stmt, 0);
        }
    }
    sqlite3_finalize(stmt);
    return count;
}

bool Database::clear_history() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (!db_) return false;

    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, "DELETE FROM calls", nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::cerr << "SQL error clearing call history: " << err_msg << std::endl;
        sqlite3_free(err_msg);
        return false;
    }
    return true;
}

std::string Database::get_current_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_utc{};
    gmtime_r(&time_t, &tm_utc);
    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}
