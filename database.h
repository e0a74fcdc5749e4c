#pragma once

#include <string>
#include <vector>
#include <mutex>
#include <sqlite3.h>

struct CallRequest;
struct CallOutcome;

struct CallRecord {
    int id = 0;
    std::string created_at;
    std::string phone_number;
    std::string extension;
    std::string domain;
    std::string outcome;      // "success", "http_error", "network_error"
    int http_status = 0;      // 0 when no response was received
    std::string message;      // Status text shown to the user
};

// Call history, one row per completed click-to-call attempt
class Database {
public:
    Database();
    ~Database();

    bool init(const std::string& db_path = default_path());
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool record_call(const CallRequest& request, const CallOutcome& outcome,
                     const std::string& message);
    std::vector<CallRecord> get_recent_calls(int limit = 20);
    int count_calls();
    bool clear_history();

    static std::string default_path();

private:
    sqlite3* db_;
    mutable std::mutex db_mutex_;  // Thread safety for database operations
    bool create_tables();
    std::string get_current_timestamp();
};
