#include "storage/history_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

namespace {

constexpr const char* INSERT_SQL =
    "INSERT INTO lookups (command, source, found, app_name, window_title) "
    "VALUES (?, ?, ?, ?, ?)";

constexpr const char* RECENT_SQL =
    "SELECT id, timestamp, command, source, found, app_name, window_title "
    "FROM lookups ORDER BY id DESC LIMIT ?";

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto* p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

} // namespace

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    close();

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);

    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    auto prepare = [this](const char* sql, sqlite3_stmt** stmt, const char* what) {
        if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) == SQLITE_OK) return true;
        std::println(stderr, "db: prepare {} failed: {}", what, sqlite3_errmsg(db_));
        return false;
    };

    if (!create_tables() ||
        !prepare(INSERT_SQL, &insert_stmt_, "insert") ||
        !prepare(RECENT_SQL, &recent_stmt_, "recent")) {
        close();
        return false;
    }
    return true;
}

void HistoryDb::close() {
    for (auto** stmt : {&insert_stmt_, &recent_stmt_}) {
        sqlite3_finalize(*stmt);
        *stmt = nullptr;
    }
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool HistoryDb::insert(const std::string& command, const std::string& source, bool found,
                       const WindowInfo& ctx) {
    if (!insert_stmt_) return false;

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);

    // Empty context is stored as NULL
    auto bind_text = [this](int idx, const std::string& val) {
        if (!val.empty()) sqlite3_bind_text(insert_stmt_, idx, val.c_str(), -1, SQLITE_TRANSIENT);
    };

    sqlite3_bind_text(insert_stmt_, 1, command.c_str(), -1, SQLITE_TRANSIENT);
    bind_text(2, source);
    sqlite3_bind_int(insert_stmt_, 3, found ? 1 : 0);
    bind_text(4, ctx.app_name());
    bind_text(5, ctx.title);

    if (sqlite3_step(insert_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: insert '{}' failed: {}", command, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit) {
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_ || limit <= 0) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        entries.push_back({
            .id = sqlite3_column_int64(recent_stmt_, 0),
            .timestamp = column_text(recent_stmt_, 1),
            .command = column_text(recent_stmt_, 2),
            .source = column_text(recent_stmt_, 3),
            .found = sqlite3_column_int(recent_stmt_, 4) != 0,
            .app_name = column_text(recent_stmt_, 5),
            .window_title = column_text(recent_stmt_, 6),
        });
    }
    return entries;
}

bool HistoryDb::clear() {
    if (!db_) return false;

    char* err = nullptr;
    if (sqlite3_exec(db_, "DELETE FROM lookups;", nullptr, nullptr, &err) != SQLITE_OK) {
        std::println(stderr, "db: clear failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS lookups (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            timestamp TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            command TEXT NOT NULL,
            source TEXT,
            found INTEGER NOT NULL DEFAULT 0,
            app_name TEXT,
            window_title TEXT
        );
    )";

    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
