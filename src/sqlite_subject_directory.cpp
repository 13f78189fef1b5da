#include "sqlite_subject_directory.h"
#include "errors.h"
#include "logger.h"

namespace gymface {

SqliteSubjectDirectory::SqliteSubjectDirectory(const std::string& db_path)
    : db_(std::make_unique<SqliteDatabase>(db_path)) {
    db_->exec(R"(
        CREATE TABLE IF NOT EXISTS subjects (
            id TEXT PRIMARY KEY,
            display_name TEXT NOT NULL DEFAULT '',
            is_active INTEGER NOT NULL DEFAULT 1
        );
    )");
}

std::optional<SubjectInfo> SqliteSubjectDirectory::find(const std::string& subject_id) {
    std::lock_guard<std::mutex> lock(db_->mutex());

    SqliteStatement stmt = db_->prepare("SELECT id, display_name, is_active FROM subjects WHERE id = ?1");
    stmt.bindText(1, subject_id);
    if (!stmt.step()) {
        return std::nullopt;
    }

    SubjectInfo info;
    info.id = stmt.columnText(0);
    info.display_name = stmt.columnText(1);
    info.is_active = stmt.columnInt(2) != 0;
    return info;
}

void SqliteSubjectDirectory::upsert(const std::string& subject_id, const std::string& display_name) {
    std::lock_guard<std::mutex> lock(db_->mutex());

    SqliteStatement stmt = db_->prepare(
        "INSERT INTO subjects (id, display_name, is_active) VALUES (?1, ?2, 1) "
        "ON CONFLICT(id) DO UPDATE SET display_name = excluded.display_name, is_active = 1");
    stmt.bindText(1, subject_id);
    stmt.bindText(2, display_name);
    stmt.step();

    Logger::getInstance().info("Subject " + subject_id + " saved");
}

void SqliteSubjectDirectory::setActive(const std::string& subject_id, bool active) {
    std::lock_guard<std::mutex> lock(db_->mutex());

    SqliteStatement stmt = db_->prepare("UPDATE subjects SET is_active = ?1 WHERE id = ?2");
    stmt.bindInt(1, active ? 1 : 0);
    stmt.bindText(2, subject_id);
    stmt.step();

    if (db_->changes() == 0) {
        throw FaceError(ErrorKind::NotFound, "Subject not found: " + subject_id);
    }
    Logger::getInstance().info("Subject " + subject_id + (active ? " enabled" : " disabled"));
}

std::vector<SubjectInfo> SqliteSubjectDirectory::list() {
    std::lock_guard<std::mutex> lock(db_->mutex());

    SqliteStatement stmt = db_->prepare("SELECT id, display_name, is_active FROM subjects ORDER BY id");
    std::vector<SubjectInfo> subjects;
    while (stmt.step()) {
        SubjectInfo info;
        info.id = stmt.columnText(0);
        info.display_name = stmt.columnText(1);
        info.is_active = stmt.columnInt(2) != 0;
        subjects.push_back(std::move(info));
    }
    return subjects;
}

} // namespace gymface
