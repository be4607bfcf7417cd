#include <catch2/catch_test_macros.hpp>

#include "storage/history_db.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>
#include <unistd.h>

namespace {

struct TmpDb {
    std::string path;

    TmpDb() {
        path = std::filesystem::temp_directory_path() /
               ("mute_test_db_" + std::to_string(getpid()) + ".sqlite");
    }

    ~TmpDb() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

HistoryRecord record(const std::string& text) {
    return {.text = text, .mode = "quick", .model = "parakeet",
            .audio_duration = 1.0, .processing_time = 0.1};
}

} // namespace

TEST_CASE("HistoryDb", "[history]") {

    SECTION("OpenCreatesFile") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));
        REQUIRE(db.is_open());
        REQUIRE(std::filesystem::exists(tmp.path));
    }

    SECTION("InsertAndRetrieve") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert({
            .text = "hello world",
            .mode = "continuous",
            .model = "whisper",
            .device = "usb-mic",
            .diarization = true,
            .audio_duration = 2.5,
            .processing_time = 0.3,
        }));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].text == "hello world");
        REQUIRE(entries[0].mode == "continuous");
        REQUIRE(entries[0].model == "whisper");
        REQUIRE(entries[0].device == "usb-mic");
        REQUIRE(entries[0].diarization);
        REQUIRE(entries[0].audio_duration == 2.5);
        REQUIRE(entries[0].processing_time == 0.3);
    }

    SECTION("LimitWorks") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        for (int i = 0; i < 5; ++i) {
            REQUIRE(db.insert(record("entry " + std::to_string(i))));
        }

        auto entries = db.recent(2);
        REQUIRE(entries.size() == 2);
    }

    SECTION("ReverseChronological") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(record("first")));
        REQUIRE(db.insert(record("second")));
        REQUIRE(db.insert(record("third")));

        auto entries = db.recent(3);
        REQUIRE(entries.size() == 3);
        REQUIRE(entries[0].text == "third");
        REQUIRE(entries[1].text == "second");
        REQUIRE(entries[2].text == "first");
    }

    SECTION("NullableFields") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        // Empty strings should be stored as NULL, retrieved as empty
        REQUIRE(db.insert({.text = "test"}));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE(entries[0].mode.empty());
        REQUIRE(entries[0].model.empty());
        REQUIRE(entries[0].device.empty());
        REQUIRE_FALSE(entries[0].diarization);
    }

    SECTION("TimestampAutoPopulated") {
        TmpDb tmp;
        HistoryDb db;
        REQUIRE(db.open(tmp.path));

        REQUIRE(db.insert(record("test")));

        auto entries = db.recent(1);
        REQUIRE(entries.size() == 1);
        REQUIRE_FALSE(entries[0].timestamp.empty());
    }

    SECTION("ClosedDbRejectsInsert") {
        HistoryDb db;
        REQUIRE_FALSE(db.insert(record("nowhere")));
        REQUIRE(db.recent(5).empty());
    }
}
