#pragma once

#include "settings_store.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct HistoryEntry {
    std::string id;          // random UUID v4
    std::string text;
    std::string timestamp;   // UTC ISO-8601, millisecond precision
    double duration = 0.0;   // seconds
    double sample_rate = 16000.0;
};

// Most-recent-first list of completed transcriptions, capped at `capacity`.
// The whole list is re-encoded into the settings store on every mutation.
class HistoryStore {
public:
    static constexpr size_t kDefaultCapacity = 50;
    static constexpr const char* kSettingsKey = "transcription_history";

    explicit HistoryStore(SettingsStore& settings, size_t capacity = kDefaultCapacity);

    HistoryStore(const HistoryStore&) = delete;
    HistoryStore& operator=(const HistoryStore&) = delete;

    // Replaces the in-memory list with the persisted one. A missing or
    // undecodable value leaves the list empty.
    void load();

    const HistoryEntry& append(std::string text, double duration, double sample_rate);
    void append(HistoryEntry entry);

    // Both return false, and write nothing, when there was nothing to drop.
    bool remove(std::string_view id);
    bool clear();

    const HistoryEntry* find(std::string_view id) const;
    std::vector<HistoryEntry> recent(size_t limit) const;
    const std::vector<HistoryEntry>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    size_t capacity() const { return capacity_; }

    static std::string encode(const std::vector<HistoryEntry>& entries);
    static std::optional<std::vector<HistoryEntry>> decode(std::string_view data);

    static std::string make_id();
    static std::string now_timestamp();

private:
    void persist();

    SettingsStore& settings_;
    size_t capacity_;
    std::vector<HistoryEntry> entries_;
};
