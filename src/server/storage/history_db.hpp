#pragma once

#include <cstdint>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    std::string filename;
    std::string text;
    double audio_duration;
    double processing_time;
    std::string model;
    nlohmann::json response;
};

// SQLite-backed record of finished transcriptions.
class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const;

    // Stores a response body under the client's original file name. Returns
    // the row id, or nullopt when the database is closed or the insert failed.
    std::optional<int64_t> save(const nlohmann::json& response, const std::string& original_name);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
