#include <catch2/catch_test_macros.hpp>

#include "storage/history_store.hpp"
#include "storage/settings_store.hpp"

#include <regex>
#include <set>
#include <string>

TEST_CASE("HistoryStore", "[history]") {
    SettingsStore settings;
    REQUIRE(settings.open(":memory:"));
    HistoryStore history(settings);

    SECTION("StartsEmpty") {
        history.load();
        REQUIRE(history.size() == 0);
        REQUIRE(history.recent(10).empty());
    }

    SECTION("AppendFillsEntry") {
        const auto& e = history.append("hello world", 2.5, 16000.0);
        REQUIRE(e.text == "hello world");
        REQUIRE(e.duration == 2.5);
        REQUIRE(e.sample_rate == 16000.0);
        REQUIRE(std::regex_match(e.id, std::regex(
            "[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-[89ab][0-9a-f]{3}-[0-9a-f]{12}")));
        REQUIRE(std::regex_match(e.timestamp, std::regex(
            R"(\d{4}-\d{2}-\d{2}T\d{2}:\d{2}:\d{2}\.\d{3}Z)")));
    }

    SECTION("NewestFirst") {
        history.append("first", 1.0, 16000.0);
        history.append("second", 1.0, 16000.0);
        history.append("third", 1.0, 16000.0);

        auto entries = history.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].text == "third");
        REQUIRE(entries[1].text == "second");
        REQUIRE(entries[2].text == "first");
    }

    SECTION("CapKeepsFiftyMostRecent") {
        for (int i = 0; i < 60; ++i) {
            history.append("entry " + std::to_string(i), 1.0, 16000.0);
        }

        REQUIRE(history.size() == 50);
        auto entries = history.recent(100);
        REQUIRE(entries.size() == 50);
        REQUIRE(entries.front().text == "entry 59");
        REQUIRE(entries.back().text == "entry 10");
    }

    SECTION("IdsAreUnique") {
        std::set<std::string> ids;
        for (int i = 0; i < 50; ++i) {
            ids.insert(history.append("x", 1.0, 16000.0).id);
        }
        REQUIRE(ids.size() == 50);
    }

    SECTION("LimitWorks") {
        for (int i = 0; i < 5; ++i) history.append("e", 1.0, 16000.0);
        REQUIRE(history.recent(2).size() == 2);
        REQUIRE(history.recent(0).empty());
    }

    SECTION("RemoveById") {
        history.append("keep", 1.0, 16000.0);
        auto id = history.append("drop", 1.0, 16000.0).id;

        REQUIRE(history.remove(id));
        REQUIRE(history.size() == 1);
        REQUIRE(history.entries()[0].text == "keep");
    }

    SECTION("FindById") {
        auto id = history.append("first", 1.0, 16000.0).id;
        history.append("second", 1.0, 16000.0);

        const auto* found = history.find(id);
        REQUIRE(found != nullptr);
        REQUIRE(found->text == "first");
        REQUIRE(history.find("not-an-id") == nullptr);
    }

    SECTION("RemoveUnknownIsNoop") {
        history.append("keep", 1.0, 16000.0);
        REQUIRE_FALSE(history.remove("not-an-id"));
        REQUIRE(history.size() == 1);
    }

    SECTION("ClearAndClearAgain") {
        history.append("a", 1.0, 16000.0);
        history.append("b", 1.0, 16000.0);
        REQUIRE(history.clear());
        REQUIRE(history.size() == 0);
        REQUIRE_FALSE(history.clear());
    }

    SECTION("PersistsEveryMutation") {
        history.append("one", 1.5, 16000.0);
        auto id = history.append("two", 2.0, 16000.0).id;

        HistoryStore reloaded(settings);
        reloaded.load();
        REQUIRE(reloaded.size() == 2);
        REQUIRE(reloaded.entries()[0].text == "two");
        REQUIRE(reloaded.entries()[0].id == id);
        REQUIRE(reloaded.entries()[1].duration == 1.5);

        history.remove(id);
        reloaded.load();
        REQUIRE(reloaded.size() == 1);

        history.clear();
        reloaded.load();
        REQUIRE(reloaded.size() == 0);
    }

    SECTION("StoredUnderHistoryKey") {
        history.append("stored", 1.0, 16000.0);
        auto raw = settings.get(HistoryStore::kSettingsKey);
        REQUIRE(raw.has_value());
        REQUIRE(raw->find("\"text\":\"stored\"") != std::string::npos);
    }

    SECTION("UndecodableValueLoadsEmpty") {
        REQUIRE(settings.set(HistoryStore::kSettingsKey, "{not json"));
        history.load();
        REQUIRE(history.size() == 0);

        REQUIRE(settings.set(HistoryStore::kSettingsKey, R"({"text":"object, not list"})"));
        history.load();
        REQUIRE(history.size() == 0);

        REQUIRE(settings.set(HistoryStore::kSettingsKey, R"([{"text":"missing fields"}])"));
        history.load();
        REQUIRE(history.size() == 0);
    }

    SECTION("LoadTruncatesToCapacity") {
        HistoryStore small(settings, 3);
        for (int i = 0; i < 5; ++i) history.append(std::to_string(i), 1.0, 16000.0);

        small.load();
        REQUIRE(small.size() == 3);
        REQUIRE(small.entries()[0].text == "4");
    }

    SECTION("WorksWithoutDatabase") {
        SettingsStore closed;
        HistoryStore memory_only(closed);
        memory_only.load();
        memory_only.append("kept in memory", 1.0, 16000.0);
        REQUIRE(memory_only.size() == 1);
    }
}

TEST_CASE("HistoryStore codec", "[history]") {

    SECTION("EncodeDecode") {
        std::vector<HistoryEntry> entries = {
            {.id = "a", .text = "héllo \"quoted\"", .timestamp = "2026-01-01T00:00:00.000Z",
             .duration = 3.25, .sample_rate = 16000.0},
        };
        auto decoded = HistoryStore::decode(HistoryStore::encode(entries));
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->size() == 1);
        REQUIRE((*decoded)[0].text == entries[0].text);
        REQUIRE((*decoded)[0].duration == 3.25);
    }

    SECTION("EmptyList") {
        auto decoded = HistoryStore::decode("[]");
        REQUIRE(decoded.has_value());
        REQUIRE(decoded->empty());
    }
}
