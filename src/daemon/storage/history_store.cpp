#include "history_store.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <format>
#include <nlohmann/json.hpp>
#include <print>
#include <random>

using json = nlohmann::json;

void to_json(json& j, const HistoryEntry& e) {
    j = json{
        {"id", e.id},
        {"text", e.text},
        {"timestamp", e.timestamp},
        {"duration", e.duration},
        {"sample_rate", e.sample_rate},
    };
}

void from_json(const json& j, HistoryEntry& e) {
    j.at("id").get_to(e.id);
    j.at("text").get_to(e.text);
    j.at("timestamp").get_to(e.timestamp);
    j.at("duration").get_to(e.duration);
    e.sample_rate = j.value("sample_rate", 16000.0);
}

HistoryStore::HistoryStore(SettingsStore& settings, size_t capacity)
    : settings_(settings), capacity_(std::max<size_t>(capacity, 1)) {}

void HistoryStore::load() {
    entries_.clear();

    auto stored = settings_.get(kSettingsKey);
    if (!stored) return;

    auto decoded = decode(*stored);
    if (!decoded) {
        std::println(stderr, "history: stored list could not be decoded, starting empty");
        return;
    }

    entries_ = std::move(*decoded);
    if (entries_.size() > capacity_) {
        entries_.resize(capacity_);
    }
}

const HistoryEntry& HistoryStore::append(std::string text, double duration, double sample_rate) {
    append(HistoryEntry{
        .id = make_id(),
        .text = std::move(text),
        .timestamp = now_timestamp(),
        .duration = duration,
        .sample_rate = sample_rate,
    });
    return entries_.front();
}

void HistoryStore::append(HistoryEntry entry) {
    entries_.insert(entries_.begin(), std::move(entry));
    if (entries_.size() > capacity_) {
        entries_.resize(capacity_);
    }
    persist();
}

bool HistoryStore::remove(std::string_view id) {
    auto it = std::ranges::find(entries_, id, &HistoryEntry::id);
    if (it == entries_.end()) return false;

    entries_.erase(it);
    persist();
    return true;
}

const HistoryEntry* HistoryStore::find(std::string_view id) const {
    auto it = std::ranges::find(entries_, id, &HistoryEntry::id);
    return it == entries_.end() ? nullptr : &*it;
}

bool HistoryStore::clear() {
    if (entries_.empty()) return false;

    entries_.clear();
    persist();
    return true;
}

std::vector<HistoryEntry> HistoryStore::recent(size_t limit) const {
    auto n = std::min(limit, entries_.size());
    return {entries_.begin(), entries_.begin() + static_cast<std::ptrdiff_t>(n)};
}

std::string HistoryStore::encode(const std::vector<HistoryEntry>& entries) {
    return json(entries).dump();
}

std::optional<std::vector<HistoryEntry>> HistoryStore::decode(std::string_view data) {
    try {
        auto j = json::parse(data);
        if (!j.is_array()) return std::nullopt;
        return j.get<std::vector<HistoryEntry>>();
    } catch (const json::exception& e) {
        std::println(stderr, "history: decode error: {}", e.what());
        return std::nullopt;
    }
}

std::string HistoryStore::make_id() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    uint64_t hi = rng();
    uint64_t lo = rng();

    // Version 4, RFC 4122 variant.
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       static_cast<uint32_t>(hi >> 32),
                       static_cast<uint16_t>(hi >> 16),
                       static_cast<uint16_t>(hi),
                       static_cast<uint16_t>(lo >> 48),
                       lo & 0xFFFFFFFFFFFFULL);
}

std::string HistoryStore::now_timestamp() {
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%TZ}", now);
}

void HistoryStore::persist() {
    if (!settings_.is_open()) return;
    if (!settings_.set(kSettingsKey, encode(entries_))) {
        std::println(stderr, "history: failed to persist {} entries", entries_.size());
    }
}
