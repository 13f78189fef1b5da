#include "sqlite_db.h"
#include "errors.h"
#include "logger.h"
#include <ctime>

namespace gymface {

// ===== SqliteDatabase =====

SqliteDatabase::SqliteDatabase(const std::string& path) : path_(path) {
    int rc = sqlite3_open_v2(path.c_str(), &db_,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX, nullptr);
    if (rc != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : sqlite3_errstr(rc);
        sqlite3_close(db_);
        db_ = nullptr;
        Logger::getInstance().error("Cannot open database " + path + ": " + msg);
        throw FaceError(ErrorKind::PersistenceFailure, PERSISTENCE_FAILURE_MESSAGE);
    }

    // Wait on competing writers instead of failing with SQLITE_BUSY
    sqlite3_busy_timeout(db_, 5000);
    exec("PRAGMA foreign_keys = ON");
}

SqliteDatabase::~SqliteDatabase() {
    if (db_) {
        sqlite3_close(db_);
    }
}

void SqliteDatabase::fail(const std::string& what) const {
    Logger::getInstance().error("SQLite error (" + what + "): " + sqlite3_errmsg(db_));
    throw FaceError(ErrorKind::PersistenceFailure, PERSISTENCE_FAILURE_MESSAGE);
}

void SqliteDatabase::exec(const std::string& sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errstr(rc);
        sqlite3_free(err_msg);
        Logger::getInstance().error("SQL error: " + msg);
        throw FaceError(ErrorKind::PersistenceFailure, PERSISTENCE_FAILURE_MESSAGE);
    }
}

SqliteStatement SqliteDatabase::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        fail("prepare");
    }
    return SqliteStatement(*this, stmt);
}

int SqliteDatabase::changes() const {
    return sqlite3_changes(db_);
}

// ===== SqliteStatement =====

SqliteStatement::SqliteStatement(SqliteDatabase& db, sqlite3_stmt* stmt)
    : db_(&db), stmt_(stmt) {
}

void SqliteStatement::checkBind(int rc) {
    if (rc != SQLITE_OK) {
        db_->fail("bind");
    }
}

void SqliteStatement::bindText(int index, const std::string& value) {
    checkBind(sqlite3_bind_text(stmt_.get(), index, value.c_str(), -1, SQLITE_TRANSIENT));
}

void SqliteStatement::bindBlob(int index, const void* data, size_t size) {
    checkBind(sqlite3_bind_blob(stmt_.get(), index, data, static_cast<int>(size), SQLITE_TRANSIENT));
}

void SqliteStatement::bindInt(int index, int value) {
    checkBind(sqlite3_bind_int(stmt_.get(), index, value));
}

void SqliteStatement::bindDouble(int index, double value) {
    checkBind(sqlite3_bind_double(stmt_.get(), index, value));
}

bool SqliteStatement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    db_->fail("step");
}

std::string SqliteStatement::columnText(int col) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

Bytes SqliteStatement::columnBlob(int col) const {
    const auto* data = static_cast<const uint8_t*>(sqlite3_column_blob(stmt_.get(), col));
    int size = sqlite3_column_bytes(stmt_.get(), col);
    if (!data || size <= 0) {
        return {};
    }
    return Bytes(data, data + size);
}

int SqliteStatement::columnInt(int col) const {
    return sqlite3_column_int(stmt_.get(), col);
}

double SqliteStatement::columnDouble(int col) const {
    return sqlite3_column_double(stmt_.get(), col);
}

bool SqliteStatement::columnIsNull(int col) const {
    return sqlite3_column_type(stmt_.get(), col) == SQLITE_NULL;
}

// ===== SqliteTransaction =====

SqliteTransaction::SqliteTransaction(SqliteDatabase& db) : db_(db) {
    db_.exec("BEGIN IMMEDIATE");
}

SqliteTransaction::~SqliteTransaction() {
    if (!done_) {
        // Destructor path: report but never throw
        if (sqlite3_exec(db_.handle(), "ROLLBACK", nullptr, nullptr, nullptr) != SQLITE_OK) {
            Logger::getInstance().error(std::string("Rollback failed: ") + sqlite3_errmsg(db_.handle()));
        }
    }
}

void SqliteTransaction::commit() {
    db_.exec("COMMIT");
    done_ = true;
}

std::string utcTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm tm_utc{};
    gmtime_r(&now, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

} // namespace gymface
