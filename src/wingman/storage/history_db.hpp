#pragma once

#include "tracking/window_info.hpp"

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

// One documentation lookup.
struct HistoryEntry {
    int64_t id = 0;
    std::string timestamp;    // UTC, ISO 8601
    std::string command;
    std::string source;       // empty when nothing was found
    bool found = false;
    std::string app_name;     // focused application at lookup time
    std::string window_title;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    // Creates the parent directory and the schema as needed.
    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const std::string& command, const std::string& source, bool found,
                const WindowInfo& context);

    // Newest first.
    std::vector<HistoryEntry> recent(int limit = 10);

    bool clear();

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
