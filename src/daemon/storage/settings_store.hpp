#pragma once

#include <optional>
#include <sqlite3.h>
#include <string>

// Persistent string key-value store backed by a single SQLite table.
class SettingsStore {
public:
    SettingsStore();
    ~SettingsStore();

    SettingsStore(const SettingsStore&) = delete;
    SettingsStore& operator=(const SettingsStore&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    std::optional<std::string> get(const std::string& key);
    bool set(const std::string& key, const std::string& value);
    bool remove(const std::string& key);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* get_stmt_ = nullptr;
    sqlite3_stmt* set_stmt_ = nullptr;
    sqlite3_stmt* remove_stmt_ = nullptr;
};
