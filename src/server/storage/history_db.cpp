#include "history_db.hpp"

#include "../log.hpp"

#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    std::lock_guard lock(mutex_);

    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        logging::error("db", "failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO transcriptions (filename, text, audio_duration, processing_time, "
        "model, response) VALUES (?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, filename, text, audio_duration, processing_time, model, response "
        "FROM transcriptions ORDER BY id DESC LIMIT ?";

    if (sqlite3_prepare_v2(db_, insert_sql, -1, &insert_stmt_, nullptr) != SQLITE_OK) {
        logging::error("db", "prepare insert failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    if (sqlite3_prepare_v2(db_, recent_sql, -1, &recent_stmt_, nullptr) != SQLITE_OK) {
        logging::error("db", "prepare recent failed: {}", sqlite3_errmsg(db_));
        return false;
    }

    logging::info("db", "history at {}", path);
    return true;
}

void HistoryDb::close() {
    std::lock_guard lock(mutex_);
    if (insert_stmt_) { sqlite3_finalize(insert_stmt_); insert_stmt_ = nullptr; }
    if (recent_stmt_) { sqlite3_finalize(recent_stmt_); recent_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::is_open() const {
    std::lock_guard lock(mutex_);
    return db_ != nullptr;
}

std::optional<int64_t> HistoryDb::save(const json& response, const std::string& original_name) {
    std::lock_guard lock(mutex_);
    if (!insert_stmt_) return std::nullopt;

    auto text = response.value("text", std::string{});
    auto model = response.value("model", std::string{});
    auto body = response.dump();

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, original_name.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, text.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_double(insert_stmt_, 3, response.value("duration_seconds", 0.0));
    sqlite3_bind_double(insert_stmt_, 4, response.value("processing_time", 0.0));
    if (model.empty()) sqlite3_bind_null(insert_stmt_, 5);
    else sqlite3_bind_text(insert_stmt_, 5, model.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 6, body.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        logging::error("db", "insert failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::lock_guard lock(mutex_);
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    auto get_text = [](sqlite3_stmt* stmt, int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        HistoryEntry e;
        e.id = sqlite3_column_int64(recent_stmt_, 0);
        e.timestamp = get_text(recent_stmt_, 1);
        e.filename = get_text(recent_stmt_, 2);
        e.text = get_text(recent_stmt_, 3);
        e.audio_duration = sqlite3_column_double(recent_stmt_, 4);
        e.processing_time = sqlite3_column_double(recent_stmt_, 5);
        e.model = get_text(recent_stmt_, 6);
        e.response = json::parse(get_text(recent_stmt_, 7), nullptr, false);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS transcriptions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            filename TEXT NOT NULL,
            text TEXT NOT NULL,
            audio_duration REAL,
            processing_time REAL,
            model TEXT,
            response TEXT NOT NULL
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        logging::error("db", "create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
