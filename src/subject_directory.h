#ifndef GYMFACE_SUBJECT_DIRECTORY_H
#define GYMFACE_SUBJECT_DIRECTORY_H

#include <optional>
#include <string>
#include <vector>

namespace gymface {

// The client as seen by the biometric core
struct SubjectInfo {
    std::string id;
    std::string display_name;
    bool is_active = true;
};

// Client lookup capability
class SubjectDirectory {
public:
    virtual ~SubjectDirectory() = default;

    // Info for an existing subject, active or not; nullopt when unknown
    virtual std::optional<SubjectInfo> find(const std::string& subject_id) = 0;

    virtual std::vector<SubjectInfo> list() = 0;
};

} // namespace gymface

#endif // GYMFACE_SUBJECT_DIRECTORY_H
