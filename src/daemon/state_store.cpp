#include "daemon/state_store.hpp"

#include <filesystem>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/sqlite_utils.hpp"

namespace camwatch {

namespace {

constexpr const char *kSchemaVersion = "1";

constexpr const char *kCreateRecordsTable =
    "CREATE TABLE IF NOT EXISTS liveness_records ("
    "    device_id TEXT PRIMARY KEY,"
    "    status TEXT NOT NULL CHECK (status IN ('UNKNOWN', 'UP', 'DOWN')),"
    "    consecutive_failures INTEGER NOT NULL CHECK (consecutive_failures >= 0),"
    "    consecutive_successes INTEGER NOT NULL CHECK (consecutive_successes >= 0),"
    "    last_changed_at INTEGER NOT NULL,"
    "    last_checked_at INTEGER NOT NULL,"
    "    CHECK (consecutive_failures = 0 OR consecutive_successes = 0)"
    ");";

constexpr const char *kCreateMetaTable =
    "CREATE TABLE IF NOT EXISTS meta ("
    "    key TEXT PRIMARY KEY,"
    "    value TEXT NOT NULL"
    ");";

void setMeta(sqlite3 *db, const std::string &key, const std::string &value)
{
    sqlite::Statement stmt(db, "INSERT OR REPLACE INTO meta (key, value) VALUES (?, ?);");
    sqlite::bindText(stmt.get(), 1, key);
    sqlite::bindText(stmt.get(), 2, value);
    sqlite::stepDoneOrThrow(stmt, "failed to set meta value");
}

} // namespace

struct StateStore::Impl {
    std::string path;
    sqlite3 *db = nullptr;
    bool schemaReady = false;

    bool ensureOpen(std::string *error);
    // Writes; only the save path may call it.
    void ensureSchema();
    bool hasRecordsTable();
    void close();
    void quarantine();
};

bool StateStore::Impl::ensureOpen(std::string *error)
{
    if (db) {
        return true;
    }

    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
        if (ec) {
            if (error) {
                *error = "cannot create " + filePath.parent_path().string() + ": " + ec.message();
            }
            return false;
        }
    }

    db = sqlite::openDatabase(path, error);
    if (!db) {
        return false;
    }

    try {
        sqlite::execOrThrow(db, "PRAGMA synchronous = FULL;");
    } catch (const std::runtime_error &ex) {
        if (error) {
            *error = ex.what();
        }
        close();
        return false;
    }
    return true;
}

void StateStore::Impl::ensureSchema()
{
    if (schemaReady) {
        return;
    }
    sqlite::execOrThrow(db, kCreateRecordsTable);
    sqlite::execOrThrow(db, kCreateMetaTable);
    setMeta(db, "schema_version", kSchemaVersion);
    schemaReady = true;
}

bool StateStore::Impl::hasRecordsTable()
{
    sqlite::Statement stmt(db,
                           "SELECT 1 FROM sqlite_master "
                           "WHERE type = 'table' AND name = 'liveness_records';");
    const int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc != SQLITE_DONE) {
        throw std::runtime_error("reading schema failed: " + sqlite::lastError(db));
    }
    return false;
}

void StateStore::Impl::close()
{
    sqlite::closeDatabase(db);
    db = nullptr;
    schemaReady = false;
}

void StateStore::Impl::quarantine()
{
    close();

    const std::string target = path + ".corrupt";
    std::error_code ec;
    std::filesystem::remove(target, ec);
    std::filesystem::rename(path, target, ec);
    if (ec) {
        CWLOG_ERROR(QStringLiteral("StateStore"),
                    QStringLiteral("quarantine"),
                    QStringLiteral("quarantine_failed"),
                    (nlohmann::json{{"path", path}, {"error", ec.message()}}));
        return;
    }

    // A leftover rollback journal would otherwise be replayed into the new file.
    std::filesystem::rename(path + "-journal", target + "-journal", ec);

    CWLOG_WARN(QStringLiteral("StateStore"),
               QStringLiteral("quarantine"),
               QStringLiteral("state_db_quarantined"),
               (nlohmann::json{{"path", path}, {"movedTo", target}}));
}

StateStore::StateStore(std::string path)
    : impl(std::make_unique<Impl>())
{
    impl->path = std::move(path);
}

StateStore::~StateStore()
{
    if (impl) {
        impl->close();
    }
}

const std::string &StateStore::path() const
{
    return impl->path;
}

MonitorState StateStore::load(std::string *error)
{
    std::error_code ec;
    if (!impl->db && !std::filesystem::exists(impl->path, ec)) {
        CWLOG_INFO(QStringLiteral("StateStore"),
                   QStringLiteral("load"),
                   QStringLiteral("state_db_missing"),
                   (nlohmann::json{{"path", impl->path}}));
        return {};
    }

    // Only a damaged file is quarantined. Anything else (a lock held by
    // another process, I/O trouble) leaves the file where it is.
    std::string message;
    bool corrupt = false;
    try {
        if (!impl->ensureOpen(&message)) {
            throw std::runtime_error(message);
        }

        if (!impl->hasRecordsTable()) {
            CWLOG_INFO(QStringLiteral("StateStore"),
                       QStringLiteral("load"),
                       QStringLiteral("state_db_empty"),
                       (nlohmann::json{{"path", impl->path}}));
            return {};
        }

        {
            sqlite::Statement check(impl->db, "PRAGMA quick_check;");
            if (sqlite3_step(check.get()) != SQLITE_ROW) {
                throw std::runtime_error("quick_check returned no result: "
                                         + sqlite::lastError(impl->db));
            }
            const std::string verdict = sqlite::columnText(check.get(), 0);
            if (verdict != "ok") {
                corrupt = true;
                throw std::runtime_error("quick_check: " + verdict);
            }
        }

        sqlite::Statement stmt(impl->db,
                               "SELECT device_id, status, consecutive_failures, "
                               "consecutive_successes, last_changed_at, last_checked_at "
                               "FROM liveness_records;");

        MonitorState state;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            LivenessRecord record;
            record.deviceId = sqlite::columnText(stmt.get(), 0);
            record.status = parseStatusString(sqlite::columnText(stmt.get(), 1));
            record.consecutiveFailures = sqlite3_column_int(stmt.get(), 2);
            record.consecutiveSuccesses = sqlite3_column_int(stmt.get(), 3);
            record.lastChangedAt = fromEpochMillis(sqlite3_column_int64(stmt.get(), 4));
            record.lastCheckedAt = fromEpochMillis(sqlite3_column_int64(stmt.get(), 5));
            state.emplace(record.deviceId, std::move(record));
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error("reading liveness_records failed: "
                                     + sqlite::lastError(impl->db));
        }

        CWLOG_DEBUG(QStringLiteral("StateStore"),
                    QStringLiteral("load"),
                    QStringLiteral("state_loaded"),
                    (nlohmann::json{{"records", state.size()}}));
        return state;
    } catch (const std::runtime_error &ex) {
        message = ex.what();
        if (impl->db) {
            const int code = sqlite3_errcode(impl->db) & 0xff;
            corrupt = corrupt || code == SQLITE_CORRUPT || code == SQLITE_NOTADB;
        }
    }

    if (error) {
        *error = message;
    }
    if (!corrupt) {
        CWLOG_ERROR(QStringLiteral("StateStore"),
                    QStringLiteral("load"),
                    QStringLiteral("state_db_unavailable"),
                    (nlohmann::json{{"path", impl->path}, {"error", message}}));
        impl->close();
        return {};
    }

    CWLOG_ERROR(QStringLiteral("StateStore"),
                QStringLiteral("load"),
                QStringLiteral("state_db_corrupt"),
                (nlohmann::json{{"path", impl->path}, {"error", message}}));
    impl->quarantine();
    return {};
}

bool StateStore::save(const MonitorState &state, std::string *error)
{
    std::string message;
    try {
        if (!impl->ensureOpen(&message)) {
            throw std::runtime_error(message);
        }

        impl->ensureSchema();

        sqlite::Transaction tx(impl->db);
        sqlite::execOrThrow(impl->db, "DELETE FROM liveness_records;");

        sqlite::Statement insert(impl->db,
                                 "INSERT INTO liveness_records (device_id, status, "
                                 "consecutive_failures, consecutive_successes, "
                                 "last_changed_at, last_checked_at) "
                                 "VALUES (?, ?, ?, ?, ?, ?);");
        for (const auto &entry : state) {
            const LivenessRecord &record = entry.second;
            sqlite3_reset(insert.get());
            sqlite3_clear_bindings(insert.get());
            sqlite::bindText(insert.get(), 1, entry.first);
            sqlite::bindText(insert.get(), 2, toStatusString(record.status));
            sqlite3_bind_int(insert.get(), 3, record.consecutiveFailures);
            sqlite3_bind_int(insert.get(), 4, record.consecutiveSuccesses);
            sqlite3_bind_int64(insert.get(), 5, toEpochMillis(record.lastChangedAt));
            sqlite3_bind_int64(insert.get(), 6, toEpochMillis(record.lastCheckedAt));
            sqlite::stepDoneOrThrow(insert, "failed to insert liveness record");
        }

        setMeta(impl->db, "last_saved_at", toIso8601Utc(std::chrono::system_clock::now()));
        tx.commit();
        return true;
    } catch (const std::runtime_error &ex) {
        message = ex.what();
    }

    CWLOG_ERROR(QStringLiteral("StateStore"),
                QStringLiteral("save"),
                QStringLiteral("state_save_failed"),
                (nlohmann::json{{"path", impl->path},
                                {"records", state.size()},
                                {"error", message}}));
    if (error) {
        *error = message;
    }
    return false;
}

} // namespace camwatch
