#ifndef GYMFACE_SQLITE_SUBJECT_DIRECTORY_H
#define GYMFACE_SQLITE_SUBJECT_DIRECTORY_H

#include "subject_directory.h"
#include "sqlite_db.h"
#include <memory>

namespace gymface {

// subjects (id TEXT PRIMARY KEY, display_name TEXT, is_active INTEGER)
class SqliteSubjectDirectory : public SubjectDirectory {
public:
    explicit SqliteSubjectDirectory(const std::string& db_path);

    std::optional<SubjectInfo> find(const std::string& subject_id) override;

    void upsert(const std::string& subject_id, const std::string& display_name);

    // FaceError(NotFound) for unknown ids
    void setActive(const std::string& subject_id, bool active);

    std::vector<SubjectInfo> list() override;

private:
    std::unique_ptr<SqliteDatabase> db_;
};

} // namespace gymface

#endif // GYMFACE_SQLITE_SUBJECT_DIRECTORY_H
