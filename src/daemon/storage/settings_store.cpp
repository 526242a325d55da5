#include "settings_store.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

SettingsStore::SettingsStore() = default;

SettingsStore::~SettingsStore() {
    close();
}

bool SettingsStore::open(const std::string& path) {
    close();

    fs::path p(path);
    if (p.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(p.parent_path(), ec);
    }

    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    const char* get_sql = "SELECT value FROM settings WHERE key = ?";
    const char* set_sql =
        "INSERT INTO settings (key, value) VALUES (?, ?) "
        "ON CONFLICT(key) DO UPDATE SET value = excluded.value";
    const char* remove_sql = "DELETE FROM settings WHERE key = ?";

    struct { const char* sql; sqlite3_stmt** stmt; const char* name; } prepared[] = {
        {get_sql, &get_stmt_, "get"},
        {set_sql, &set_stmt_, "set"},
        {remove_sql, &remove_stmt_, "remove"},
    };
    for (auto& stmt : prepared) {
        if (sqlite3_prepare_v2(db_, stmt.sql, -1, stmt.stmt, nullptr) != SQLITE_OK) {
            std::println(stderr, "db: prepare {} failed: {}", stmt.name, sqlite3_errmsg(db_));
            close();
            return false;
        }
    }

    return true;
}

void SettingsStore::close() {
    if (get_stmt_) { sqlite3_finalize(get_stmt_); get_stmt_ = nullptr; }
    if (set_stmt_) { sqlite3_finalize(set_stmt_); set_stmt_ = nullptr; }
    if (remove_stmt_) { sqlite3_finalize(remove_stmt_); remove_stmt_ = nullptr; }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

std::optional<std::string> SettingsStore::get(const std::string& key) {
    if (!get_stmt_) return std::nullopt;

    sqlite3_reset(get_stmt_);
    sqlite3_bind_text(get_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    std::optional<std::string> value;
    int rc = sqlite3_step(get_stmt_);
    if (rc == SQLITE_ROW) {
        auto* p = sqlite3_column_text(get_stmt_, 0);
        value = p ? reinterpret_cast<const char*>(p) : "";
    } else if (rc != SQLITE_DONE) {
        std::println(stderr, "db: get {} failed: {}", key, sqlite3_errmsg(db_));
    }
    sqlite3_reset(get_stmt_);
    return value;
}

bool SettingsStore::set(const std::string& key, const std::string& value) {
    if (!set_stmt_) return false;

    sqlite3_reset(set_stmt_);
    sqlite3_bind_text(set_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(set_stmt_, 2, value.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(set_stmt_);
    sqlite3_reset(set_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: set {} failed: {}", key, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool SettingsStore::remove(const std::string& key) {
    if (!remove_stmt_) return false;

    sqlite3_reset(remove_stmt_);
    sqlite3_bind_text(remove_stmt_, 1, key.c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(remove_stmt_);
    sqlite3_reset(remove_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: remove {} failed: {}", key, sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool SettingsStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS settings (
            key TEXT PRIMARY KEY,
            value TEXT NOT NULL
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
