#include <tomato/history/history_store.hpp>

#include <tomato/util/dev_log.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <sqlite3.h>

#include <cstdlib>
#include <string_view>

namespace tomato::history {

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // history

    struct history {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "History";
    };

} // namespace grp

static constexpr std::string_view kDurationColumn = "duration_seconds";
static constexpr std::string_view kLegacyDurationColumn = "duration_secs";

// -------------------------------------------------------------------------------------------------
// Locations

std::filesystem::path DataDirectory() {
#ifdef _WIN32
    if (const char *localAppData = std::getenv("LOCALAPPDATA"); localAppData != nullptr && *localAppData != '\0') {
        return std::filesystem::path{localAppData} / kAppDirectoryName;
    }
#else
    if (const char *xdgDataHome = std::getenv("XDG_DATA_HOME"); xdgDataHome != nullptr && *xdgDataHome != '\0') {
        return std::filesystem::path{xdgDataHome} / kAppDirectoryName;
    }
    if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
        return std::filesystem::path{home} / ".local" / "share" / kAppDirectoryName;
    }
#endif
    return std::filesystem::path{"."} / kAppDirectoryName;
}

std::filesystem::path DatabasePath() {
    return DataDirectory() / kDatabaseFileName;
}

// -------------------------------------------------------------------------------------------------
// Results

std::string HistoryResult::string() const {
    switch (type) {
    case Type::Success: return "Success";
    case Type::NotOpen: return "History database is not open";
    case Type::FilesystemError: return fmt::format("Filesystem error: {}", errorCode.message());
    case Type::DatabaseError: return fmt::format("Database error {}: {}", sqliteCode, message);
    }
    return "Unknown error";
}

// -------------------------------------------------------------------------------------------------
// Store

HistoryStore::~HistoryStore() {
    Close();
}

HistoryResult HistoryStore::Open(const std::filesystem::path &path) {
    Close();

    if (path.has_parent_path()) {
        std::error_code error{};
        std::filesystem::create_directories(path.parent_path(), error);
        if (error) {
            devlog::error<grp::history>("Could not create {}: {}", path.parent_path(), error.message());
            return HistoryResult::FilesystemError(error);
        }
    }

    const std::string pathStr = path.string();
    const int rc = sqlite3_open_v2(pathStr.c_str(), &m_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        auto result = MakeDatabaseError(rc);
        devlog::error<grp::history>("Unable to open database {}: {}", path, result.message);
        Close();
        return result;
    }
    m_path = path;

    if (auto result = InitSchema(); !result) {
        Close();
        return result;
    }
    if (auto result = DetectDurationColumn(); !result) {
        Close();
        return result;
    }
    if (auto result = PrepareStatements(); !result) {
        Close();
        return result;
    }

    devlog::info<grp::history>("Opened history database {}", path);
    return HistoryResult::Success();
}

void HistoryStore::Close() {
    for (sqlite3_stmt **stmt : {&m_insertStmt, &m_loadStmt, &m_countStmt}) {
        if (*stmt != nullptr) {
            sqlite3_finalize(*stmt);
            *stmt = nullptr;
        }
    }
    if (m_db != nullptr) {
        sqlite3_close(m_db);
        m_db = nullptr;
    }
    m_path.clear();
    m_durationColumn.clear();
}

HistoryResult HistoryStore::MakeDatabaseError(int code) const {
    const char *message = m_db != nullptr ? sqlite3_errmsg(m_db) : sqlite3_errstr(code);
    return HistoryResult::DatabaseError(code, message != nullptr ? message : "");
}

HistoryResult HistoryStore::InitSchema() {
    static constexpr const char *kSchema = R"(
        CREATE TABLE IF NOT EXISTS focus_records (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            task TEXT NOT NULL,
            duration_seconds INTEGER NOT NULL,
            completed_at TEXT NOT NULL,
            completed_pomodoros INTEGER NOT NULL
        );
    )";

    char *errorMessage = nullptr;
    const int rc = sqlite3_exec(m_db, kSchema, nullptr, nullptr, &errorMessage);
    if (rc != SQLITE_OK) {
        std::string message = errorMessage != nullptr ? errorMessage : sqlite3_errstr(rc);
        sqlite3_free(errorMessage);
        devlog::error<grp::history>("Failed to create schema: {}", message);
        return HistoryResult::DatabaseError(rc, std::move(message));
    }
    return HistoryResult::Success();
}

HistoryResult HistoryStore::DetectDurationColumn() {
    sqlite3_stmt *stmt = nullptr;
    int rc = sqlite3_prepare_v2(m_db, "PRAGMA table_info(focus_records)", -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        auto result = MakeDatabaseError(rc);
        devlog::error<grp::history>("Failed to inspect schema: {}", result.message);
        return result;
    }

    bool hasCurrent = false;
    bool hasLegacy = false;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        const auto *name = reinterpret_cast<const char *>(sqlite3_column_text(stmt, 1));
        if (name == nullptr) {
            continue;
        }
        const std::string_view column{name};
        hasCurrent |= column == kDurationColumn;
        hasLegacy |= column == kLegacyDurationColumn;
    }
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        auto result = MakeDatabaseError(rc);
        devlog::error<grp::history>("Failed to inspect schema: {}", result.message);
        return result;
    }

    if (!hasCurrent && hasLegacy) {
        m_durationColumn = kLegacyDurationColumn;
        devlog::info<grp::history>("Using legacy column {}", kLegacyDurationColumn);
    } else {
        m_durationColumn = kDurationColumn;
    }
    return HistoryResult::Success();
}

HistoryResult HistoryStore::PrepareStatements() {
    auto prepare = [&](const char *sql, sqlite3_stmt **stmt) -> HistoryResult {
        const int rc = sqlite3_prepare_v2(m_db, sql, -1, stmt, nullptr);
        if (rc != SQLITE_OK) {
            auto result = MakeDatabaseError(rc);
            devlog::error<grp::history>("Failed to prepare statement: {}", result.message);
            *stmt = nullptr;
            return result;
        }
        return HistoryResult::Success();
    };

    const std::string insertSQL = fmt::format(R"(
            INSERT INTO focus_records (task, {}, completed_at, completed_pomodoros)
            VALUES (?1, ?2, ?3, ?4)
        )",
                                              m_durationColumn);
    if (auto result = prepare(insertSQL.c_str(), &m_insertStmt); !result) {
        return result;
    }
    const std::string loadSQL = fmt::format(R"(
            SELECT id, task, {}, completed_at, completed_pomodoros
            FROM focus_records
            ORDER BY completed_at DESC, id DESC
            LIMIT ?1
        )",
                                            m_durationColumn);
    if (auto result = prepare(loadSQL.c_str(), &m_loadStmt); !result) {
        return result;
    }
    return prepare("SELECT COUNT(*) FROM focus_records", &m_countStmt);
}

HistoryResult HistoryStore::Append(FocusRecord &record) {
    if (!IsOpen()) {
        return HistoryResult::NotOpen();
    }

    sqlite3_reset(m_insertStmt);
    sqlite3_clear_bindings(m_insertStmt);
    sqlite3_bind_text(m_insertStmt, 1, record.task.c_str(), static_cast<int>(record.task.size()), SQLITE_TRANSIENT);
    sqlite3_bind_int64(m_insertStmt, 2, record.durationSeconds);
    sqlite3_bind_text(m_insertStmt, 3, record.completedAt.c_str(), static_cast<int>(record.completedAt.size()),
                      SQLITE_TRANSIENT);
    sqlite3_bind_int64(m_insertStmt, 4, static_cast<sint64>(record.completedPomodoros));

    const int rc = sqlite3_step(m_insertStmt);
    if (rc != SQLITE_DONE) {
        auto result = MakeDatabaseError(rc);
        sqlite3_reset(m_insertStmt);
        devlog::warn<grp::history>("Failed to append focus record: {}", result.message);
        return result;
    }
    sqlite3_reset(m_insertStmt);

    record.id = sqlite3_last_insert_rowid(m_db);
    devlog::debug<grp::history>("Appended focus record #{} \"{}\" ({} s) at {}", record.id, record.task,
                                record.durationSeconds, record.completedAt);
    return HistoryResult::Success();
}

HistoryResult HistoryStore::Load(uint32 limit, std::vector<FocusRecord> &out) const {
    if (!IsOpen()) {
        return HistoryResult::NotOpen();
    }

    // A negative LIMIT means no limit in SQLite
    sqlite3_reset(m_loadStmt);
    sqlite3_bind_int64(m_loadStmt, 1, limit > 0 ? static_cast<sint64>(limit) : -1);

    std::vector<FocusRecord> records{};
    int rc;
    while ((rc = sqlite3_step(m_loadStmt)) == SQLITE_ROW) {
        auto &record = records.emplace_back();
        record.id = sqlite3_column_int64(m_loadStmt, 0);
        if (auto *text = sqlite3_column_text(m_loadStmt, 1)) {
            record.task.assign(reinterpret_cast<const char *>(text),
                               static_cast<size_t>(sqlite3_column_bytes(m_loadStmt, 1)));
        }
        record.durationSeconds = sqlite3_column_int64(m_loadStmt, 2);
        if (auto *text = sqlite3_column_text(m_loadStmt, 3)) {
            record.completedAt.assign(reinterpret_cast<const char *>(text),
                                      static_cast<size_t>(sqlite3_column_bytes(m_loadStmt, 3)));
        }
        const sint64 pomodoros = sqlite3_column_int64(m_loadStmt, 4);
        record.completedPomodoros = pomodoros > 0 ? static_cast<uint32>(pomodoros) : 0;
    }

    if (rc != SQLITE_DONE) {
        auto result = MakeDatabaseError(rc);
        sqlite3_reset(m_loadStmt);
        devlog::warn<grp::history>("Failed to load focus records: {}", result.message);
        return result;
    }
    sqlite3_reset(m_loadStmt);

    out = std::move(records);
    return HistoryResult::Success();
}

HistoryResult HistoryStore::Count(uint64 &out) const {
    if (!IsOpen()) {
        return HistoryResult::NotOpen();
    }

    sqlite3_reset(m_countStmt);
    const int rc = sqlite3_step(m_countStmt);
    if (rc != SQLITE_ROW) {
        auto result = MakeDatabaseError(rc);
        sqlite3_reset(m_countStmt);
        return result;
    }
    out = static_cast<uint64>(sqlite3_column_int64(m_countStmt, 0));
    sqlite3_reset(m_countStmt);
    return HistoryResult::Success();
}

} // namespace tomato::history
