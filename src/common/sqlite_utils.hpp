#pragma once

#include <string>

#include <sqlite3.h>

namespace camwatch::sqlite {

// Prepared statement owner. Throws std::runtime_error if preparation fails.
class Statement {
public:
    Statement(sqlite3 *db, const char *sql);
    ~Statement();

    Statement(const Statement &) = delete;
    Statement &operator=(const Statement &) = delete;

    sqlite3_stmt *get() const
    {
        return m_stmt;
    }

private:
    sqlite3_stmt *m_stmt = nullptr;
};

// BEGIN IMMEDIATE on construction. Rolls back on destruction unless commit()
// succeeded, so an exception anywhere in between leaves the database untouched.
class Transaction {
public:
    explicit Transaction(sqlite3 *db);
    ~Transaction();

    Transaction(const Transaction &) = delete;
    Transaction &operator=(const Transaction &) = delete;

    void commit();

private:
    sqlite3 *m_db = nullptr;
    bool m_done = false;
};

// Opens (creating if needed) the database file, with a busy timeout so the
// command thread and scheduler thread do not fail on a short lock.
sqlite3 *openDatabase(const std::string &path, std::string *error);
void closeDatabase(sqlite3 *db);

void execOrThrow(sqlite3 *db, const char *sql);
void stepDoneOrThrow(const Statement &stmt, const char *what);

void bindText(sqlite3_stmt *stmt, int index, const std::string &value);
std::string columnText(sqlite3_stmt *stmt, int index);

std::string lastError(sqlite3 *db);

} // namespace camwatch::sqlite
