#include "history_db.hpp"

#include <cmath>
#include <filesystem>
#include <format>
#include <print>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    // Ensure parent directory exists
    fs::path p(path);
    std::error_code ec;
    fs::create_directories(p.parent_path(), ec);

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Transcriptions finish on worker threads while the loop reads history
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) return false;

    const char* insert_sql =
        "INSERT INTO transcriptions (text, filename, title, duration, processing_time, "
        "app_name, model) VALUES (?, ?, ?, ?, ?, ?, ?)";

    const char* recent_sql =
        "SELECT id, timestamp, text, filename, title, duration, processing_time, "
        "app_name, model FROM transcriptions ORDER BY id DESC LIMIT ?";

    const char* remove_sql = "DELETE FROM transcriptions WHERE id = ?";

    const char* stats_sql =
        "SELECT text, duration, app_name, "
        "timestamp >= strftime('%Y-%m-%dT%H:%M:%f', 'now', '-7 days') "
        "FROM transcriptions";

    struct { const char* sql; sqlite3_stmt** stmt; const char* name; } prepared[] = {
        {insert_sql, &insert_stmt_, "insert"},
        {recent_sql, &recent_stmt_, "recent"},
        {remove_sql, &remove_stmt_, "remove"},
        {stats_sql, &stats_stmt_, "stats"},
    };
    for (auto& ps : prepared) {
        if (sqlite3_prepare_v2(db_, ps.sql, -1, ps.stmt, nullptr) != SQLITE_OK) {
            std::println(stderr, "db: prepare {} failed: {}", ps.name, sqlite3_errmsg(db_));
            return false;
        }
    }

    return true;
}

void HistoryDb::close() {
    for (auto* stmt : {&insert_stmt_, &recent_stmt_, &remove_stmt_, &stats_stmt_}) {
        if (*stmt) { sqlite3_finalize(*stmt); *stmt = nullptr; }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

std::optional<int64_t> HistoryDb::insert(const HistoryRecord& rec) {
    if (!insert_stmt_) return std::nullopt;

    sqlite3_reset(insert_stmt_);
    sqlite3_bind_text(insert_stmt_, 1, rec.transcript.c_str(), -1, SQLITE_TRANSIENT);

    auto bind_nullable = [this](int idx, const std::string& val) {
        if (val.empty()) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    bind_nullable(2, rec.filename);
    bind_nullable(3, rec.title);
    sqlite3_bind_double(insert_stmt_, 4, rec.duration);
    sqlite3_bind_double(insert_stmt_, 5, rec.processing_time);
    bind_nullable(6, rec.app_name);
    bind_nullable(7, rec.model);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
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
        e.record.transcript = get_text(recent_stmt_, 2);
        e.record.filename = get_text(recent_stmt_, 3);
        e.record.title = get_text(recent_stmt_, 4);
        e.record.duration = sqlite3_column_double(recent_stmt_, 5);
        e.record.processing_time = sqlite3_column_double(recent_stmt_, 6);
        e.record.app_name = get_text(recent_stmt_, 7);
        e.record.model = get_text(recent_stmt_, 8);
        entries.push_back(std::move(e));
    }

    return entries;
}

bool HistoryDb::remove(int64_t id) {
    if (!remove_stmt_) return false;

    sqlite3_reset(remove_stmt_);
    sqlite3_bind_int64(remove_stmt_, 1, id);
    if (sqlite3_step(remove_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: delete failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

DashboardStats HistoryDb::stats() {
    DashboardStats s;
    uint64_t total_words = 0;
    double total_duration_s = 0.0;
    std::set<std::string> apps;

    if (stats_stmt_) {
        sqlite3_reset(stats_stmt_);
        while (sqlite3_step(stats_stmt_) == SQLITE_ROW) {
            auto* text = sqlite3_column_text(stats_stmt_, 0);
            uint64_t words = text ? count_words(reinterpret_cast<const char*>(text)) : 0;
            total_words += words;
            total_duration_s += sqlite3_column_double(stats_stmt_, 1);

            if (sqlite3_column_int(stats_stmt_, 3) != 0) {
                s.words_this_week += words;
                auto* app = sqlite3_column_text(stats_stmt_, 2);
                if (app && *app) apps.insert(reinterpret_cast<const char*>(app));
            }
        }
    }

    s.apps_used = apps.size();

    double total_minutes = total_duration_s / 60.0;
    if (total_minutes > 0.1) {
        s.wpm = static_cast<uint64_t>(std::round(static_cast<double>(total_words) / total_minutes));
    }

    // 40 wpm typing speed
    auto minutes_saved = static_cast<uint64_t>(std::round(static_cast<double>(s.words_this_week) / 40.0));
    s.saved_time = std::format("{} minute{}", minutes_saved, minutes_saved != 1 ? "s" : "");
    return s;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS transcriptions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            text TEXT NOT NULL,
            filename TEXT,
            title TEXT,
            duration REAL,
            processing_time REAL,
            app_name TEXT,
            model TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

uint64_t count_words(const std::string& text) {
    std::istringstream in(text);
    std::string word;
    uint64_t n = 0;
    while (in >> word) ++n;
    return n;
}
