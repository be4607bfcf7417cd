#pragma once

#include <cstdint>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryRecord {
    std::string text;
    std::string mode;
    std::string model;
    std::string device;
    bool diarization = false;
    double audio_duration = 0.0;
    double processing_time = 0.0;
};

struct HistoryEntry {
    int64_t id;
    std::string timestamp;
    std::string text;
    std::string mode;
    std::string model;
    std::string device;
    bool diarization;
    double audio_duration;
    double processing_time;
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    bool insert(const HistoryRecord& record);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
