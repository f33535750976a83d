#include "daemon/subscriber_registry.hpp"

#include <filesystem>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/sqlite_utils.hpp"

namespace camwatch {

namespace {

constexpr const char *kCreateSubscribersTable =
    "CREATE TABLE IF NOT EXISTS subscribers ("
    "    chat_id INTEGER PRIMARY KEY,"
    "    added_at INTEGER NOT NULL"
    ");";

} // namespace

struct SubscriberRegistry::Impl {
    std::string path;
    sqlite3 *db = nullptr;

    // Throws std::runtime_error when the database cannot be opened.
    sqlite3 *handle();
};

sqlite3 *SubscriberRegistry::Impl::handle()
{
    if (db) {
        return db;
    }

    const std::filesystem::path filePath(path);
    if (filePath.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(filePath.parent_path(), ec);
    }

    std::string error;
    sqlite3 *opened = sqlite::openDatabase(path, &error);
    if (!opened) {
        throw std::runtime_error("cannot open " + path + ": " + error);
    }

    try {
        sqlite::execOrThrow(opened, "PRAGMA synchronous = FULL;");
        sqlite::execOrThrow(opened, kCreateSubscribersTable);
    } catch (const std::runtime_error &) {
        sqlite::closeDatabase(opened);
        throw;
    }

    db = opened;
    return db;
}

SubscriberRegistry::SubscriberRegistry(std::string path)
    : impl(std::make_unique<Impl>())
{
    impl->path = std::move(path);
}

SubscriberRegistry::~SubscriberRegistry()
{
    if (impl) {
        sqlite::closeDatabase(impl->db);
        impl->db = nullptr;
    }
}

const std::string &SubscriberRegistry::path() const
{
    return impl->path;
}

std::vector<Subscriber> SubscriberRegistry::list(std::string *error) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        sqlite::Statement stmt(impl->handle(),
                               "SELECT chat_id, added_at FROM subscribers ORDER BY chat_id;");
        std::vector<Subscriber> subscribers;
        int rc = SQLITE_ROW;
        while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
            Subscriber subscriber;
            subscriber.chatId = sqlite3_column_int64(stmt.get(), 0);
            subscriber.addedAt = fromEpochMillis(sqlite3_column_int64(stmt.get(), 1));
            subscribers.push_back(subscriber);
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error("reading subscribers failed: "
                                     + sqlite::lastError(impl->db));
        }
        return subscribers;
    } catch (const std::runtime_error &ex) {
        CWLOG_ERROR(QStringLiteral("SubscriberRegistry"),
                    QStringLiteral("list"),
                    QStringLiteral("subscriber_read_failed"),
                    (nlohmann::json{{"path", impl->path}, {"error", ex.what()}}));
        if (error) {
            *error = ex.what();
        }
        return {};
    }
}

AddResult SubscriberRegistry::add(std::int64_t chatId, std::string *error)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        // INSERT OR IGNORE keeps the original addedAt of an existing subscriber.
        sqlite::Statement stmt(impl->handle(),
                               "INSERT OR IGNORE INTO subscribers (chat_id, added_at) "
                               "VALUES (?, ?);");
        Subscriber subscriber;
        subscriber.chatId = chatId;
        subscriber.addedAt = std::chrono::system_clock::now();
        sqlite3_bind_int64(stmt.get(), 1, subscriber.chatId);
        sqlite3_bind_int64(stmt.get(), 2, toEpochMillis(subscriber.addedAt));
        sqlite::stepDoneOrThrow(stmt, "failed to add subscriber");

        if (sqlite3_changes(impl->db) == 0) {
            return AddResult::AlreadyPresent;
        }
        CWLOG_INFO(QStringLiteral("SubscriberRegistry"),
                   QStringLiteral("add"),
                   QStringLiteral("subscriber_added"),
                   (nlohmann::json{{"subscriber", subscriber}}));
        return AddResult::Added;
    } catch (const std::runtime_error &ex) {
        CWLOG_ERROR(QStringLiteral("SubscriberRegistry"),
                    QStringLiteral("add"),
                    QStringLiteral("subscriber_write_failed"),
                    (nlohmann::json{{"chatId", chatId}, {"error", ex.what()}}));
        if (error) {
            *error = ex.what();
        }
        return AddResult::StorageError;
    }
}

RemoveResult SubscriberRegistry::remove(std::int64_t chatId, std::string *error)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        sqlite::Statement stmt(impl->handle(), "DELETE FROM subscribers WHERE chat_id = ?;");
        sqlite3_bind_int64(stmt.get(), 1, chatId);
        sqlite::stepDoneOrThrow(stmt, "failed to remove subscriber");

        if (sqlite3_changes(impl->db) == 0) {
            return RemoveResult::NotPresent;
        }
        CWLOG_INFO(QStringLiteral("SubscriberRegistry"),
                   QStringLiteral("remove"),
                   QStringLiteral("subscriber_removed"),
                   (nlohmann::json{{"chatId", chatId}}));
        return RemoveResult::Removed;
    } catch (const std::runtime_error &ex) {
        CWLOG_ERROR(QStringLiteral("SubscriberRegistry"),
                    QStringLiteral("remove"),
                    QStringLiteral("subscriber_write_failed"),
                    (nlohmann::json{{"chatId", chatId}, {"error", ex.what()}}));
        if (error) {
            *error = ex.what();
        }
        return RemoveResult::StorageError;
    }
}

bool SubscriberRegistry::contains(std::int64_t chatId) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    try {
        sqlite::Statement stmt(impl->handle(),
                               "SELECT 1 FROM subscribers WHERE chat_id = ? LIMIT 1;");
        sqlite3_bind_int64(stmt.get(), 1, chatId);
        return sqlite3_step(stmt.get()) == SQLITE_ROW;
    } catch (const std::runtime_error &ex) {
        CWLOG_ERROR(QStringLiteral("SubscriberRegistry"),
                    QStringLiteral("contains"),
                    QStringLiteral("subscriber_read_failed"),
                    (nlohmann::json{{"chatId", chatId}, {"error", ex.what()}}));
        return false;
    }
}

} // namespace camwatch
