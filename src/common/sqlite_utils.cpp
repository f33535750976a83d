#include "common/sqlite_utils.hpp"

#include <stdexcept>

namespace camwatch::sqlite {

namespace {

constexpr int kBusyTimeoutMs = 2000;

} // namespace

Statement::Statement(sqlite3 *db, const char *sql)
{
    if (sqlite3_prepare_v2(db, sql, -1, &m_stmt, nullptr) != SQLITE_OK) {
        const std::string message = "sqlite prepare failed: " + lastError(db);
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
        throw std::runtime_error(message);
    }
}

Statement::~Statement()
{
    if (m_stmt) {
        sqlite3_finalize(m_stmt);
    }
}

Transaction::Transaction(sqlite3 *db)
    : m_db(db)
{
    execOrThrow(m_db, "BEGIN IMMEDIATE;");
}

Transaction::~Transaction()
{
    if (!m_done) {
        sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
}

void Transaction::commit()
{
    execOrThrow(m_db, "COMMIT;");
    m_done = true;
}

sqlite3 *openDatabase(const std::string &path, std::string *error)
{
    sqlite3 *db = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(path.c_str(), &db, flags, nullptr) != SQLITE_OK) {
        if (error) {
            *error = db ? lastError(db) : std::string("sqlite open failed");
        }
        sqlite3_close(db);
        return nullptr;
    }
    sqlite3_busy_timeout(db, kBusyTimeoutMs);
    return db;
}

void closeDatabase(sqlite3 *db)
{
    if (db) {
        sqlite3_close(db);
    }
}

void execOrThrow(sqlite3 *db, const char *sql)
{
    char *error = nullptr;
    if (sqlite3_exec(db, sql, nullptr, nullptr, &error) != SQLITE_OK) {
        std::string message = error ? error : "sqlite exec failed";
        sqlite3_free(error);
        throw std::runtime_error(message);
    }
}

void stepDoneOrThrow(const Statement &stmt, const char *what)
{
    if (sqlite3_step(stmt.get()) != SQLITE_DONE) {
        throw std::runtime_error(std::string(what) + ": "
                                 + lastError(sqlite3_db_handle(stmt.get())));
    }
}

void bindText(sqlite3_stmt *stmt, int index, const std::string &value)
{
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

std::string columnText(sqlite3_stmt *stmt, int index)
{
    const unsigned char *text = sqlite3_column_text(stmt, index);
    if (!text) {
        return {};
    }
    return reinterpret_cast<const char *>(text);
}

std::string lastError(sqlite3 *db)
{
    const char *message = sqlite3_errmsg(db);
    return message ? message : "unknown sqlite error";
}

} // namespace camwatch::sqlite
