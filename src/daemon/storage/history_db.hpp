#pragma once

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryRecord {
    std::string transcript;
    std::string filename;
    std::string title;
    double duration = 0.0;
    double processing_time = 0.0;
    std::string app_name;
    std::string model;
};

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    HistoryRecord record;
};

struct DashboardStats {
    uint64_t wpm = 0;
    uint64_t words_this_week = 0;
    uint64_t apps_used = 0;
    std::string saved_time;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();

    // Returns the new row id.
    std::optional<int64_t> insert(const HistoryRecord& record);

    std::vector<HistoryEntry> recent(int limit = 10);

    bool remove(int64_t id);

    // Weekly word and app counts, all-time words per minute.
    DashboardStats stats();

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* remove_stmt_ = nullptr;
    sqlite3_stmt* stats_stmt_ = nullptr;
};

// Whitespace separated words.
uint64_t count_words(const std::string& text);
