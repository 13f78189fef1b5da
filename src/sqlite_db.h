#ifndef GYMFACE_SQLITE_DB_H
#define GYMFACE_SQLITE_DB_H

#include "crypto_utils.h"
#include <sqlite3.h>
#include <memory>
#include <mutex>
#include <string>

namespace gymface {

class SqliteStatement;

// One sqlite3 connection. Errors are logged and rethrown as FaceError(PersistenceFailure).
class SqliteDatabase {
public:
    explicit SqliteDatabase(const std::string& path);
    ~SqliteDatabase();

    SqliteDatabase(const SqliteDatabase&) = delete;
    SqliteDatabase& operator=(const SqliteDatabase&) = delete;

    sqlite3* handle() { return db_; }
    const std::string& path() const { return path_; }

    // Serializes use of the connection across threads
    std::mutex& mutex() { return mutex_; }

    void exec(const std::string& sql);
    SqliteStatement prepare(const std::string& sql);
    int changes() const;

    [[noreturn]] void fail(const std::string& what) const;

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    std::mutex mutex_;
};

class SqliteStatement {
public:
    SqliteStatement(SqliteDatabase& db, sqlite3_stmt* stmt);

    void bindText(int index, const std::string& value);
    void bindBlob(int index, const void* data, size_t size);
    void bindInt(int index, int value);
    void bindDouble(int index, double value);

    // true while rows are available, false when done
    bool step();

    std::string columnText(int col) const;
    Bytes columnBlob(int col) const;
    int columnInt(int col) const;
    double columnDouble(int col) const;
    bool columnIsNull(int col) const;

private:
    struct Finalizer {
        void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
    };

    SqliteDatabase* db_;
    std::unique_ptr<sqlite3_stmt, Finalizer> stmt_;

    void checkBind(int rc);
};

// BEGIN IMMEDIATE ... COMMIT; rolls back when destroyed uncommitted
class SqliteTransaction {
public:
    explicit SqliteTransaction(SqliteDatabase& db);
    ~SqliteTransaction();

    SqliteTransaction(const SqliteTransaction&) = delete;
    SqliteTransaction& operator=(const SqliteTransaction&) = delete;

    void commit();

private:
    SqliteDatabase& db_;
    bool done_ = false;
};

// UTC "YYYY-MM-DDTHH:MM:SSZ"
std::string utcTimestamp();

} // namespace gymface

#endif // GYMFACE_SQLITE_DB_H
