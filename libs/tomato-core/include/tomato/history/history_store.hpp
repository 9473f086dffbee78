#pragma once

/**
@file
@brief Durable append-only log of completed focus phases, backed by SQLite.

Records are never updated or deleted. `Load` returns them newest first.
*/

#include "focus_record.hpp"
#include "history_result.hpp"

#include <tomato/core/types.hpp>

#include <filesystem>
#include <string>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace tomato::history {

inline constexpr const char *kDatabaseFileName = "red_tomato.db";
inline constexpr const char *kAppDirectoryName = "red-tomato";

// Per-user application data directory. Copying it moves the whole history.
std::filesystem::path DataDirectory();

std::filesystem::path DatabasePath();

class HistoryStore {
public:
    HistoryStore() = default;
    ~HistoryStore();

    HistoryStore(const HistoryStore &) = delete;
    HistoryStore &operator=(const HistoryStore &) = delete;

    // Opens (creating if needed) the database at path and its parent directory, then creates the schema.
    HistoryResult Open(const std::filesystem::path &path);
    void Close();

    bool IsOpen() const {
        return m_db != nullptr;
    }

    const std::filesystem::path &Path() const {
        return m_path;
    }

    // Persists a record. On success record.id receives the assigned key.
    HistoryResult Append(FocusRecord &record);

    // Loads records ordered by completion time, newest first. A limit of 0 loads everything.
    HistoryResult Load(uint32 limit, std::vector<FocusRecord> &out) const;

    HistoryResult Count(uint64 &out) const;

private:
    sqlite3 *m_db = nullptr;
    sqlite3_stmt *m_insertStmt = nullptr;
    sqlite3_stmt *m_loadStmt = nullptr;
    sqlite3_stmt *m_countStmt = nullptr;
    std::filesystem::path m_path;

    // Databases written by earlier releases name the duration column duration_secs
    std::string m_durationColumn;

    HistoryResult InitSchema();
    HistoryResult DetectDurationColumn();
    HistoryResult PrepareStatements();
    HistoryResult MakeDatabaseError(int code) const;
};

} // namespace tomato::history
