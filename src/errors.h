#ifndef GYMFACE_ERRORS_H
#define GYMFACE_ERRORS_H

#include <stdexcept>
#include <string>

namespace gymface {

// Failure categories surfaced by the recognition service
enum class ErrorKind {
    None,
    InputValidation,     // malformed/oversized/wrong-format image, wrong-dimension embedding
    DetectionFailure,    // zero or multiple faces
    QualityRejection,    // face too small, bad angle, clustered landmarks, implausible age/gender
    SpoofRejection,      // a liveness sub-check fired above the configured score
    PersistenceFailure,  // database errors
    NotFound,            // subject or active record absent
    Unexpected
};

inline const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:               return "none";
        case ErrorKind::InputValidation:    return "input_validation";
        case ErrorKind::DetectionFailure:   return "detection_failure";
        case ErrorKind::QualityRejection:   return "quality_rejection";
        case ErrorKind::SpoofRejection:     return "spoof_rejection";
        case ErrorKind::PersistenceFailure: return "persistence_failure";
        case ErrorKind::NotFound:           return "not_found";
        case ErrorKind::Unexpected:         return "unexpected";
    }
    return "unexpected";
}

// Thrown inside the core; converted to a structured result by FaceRecognitionService
class FaceError : public std::runtime_error {
public:
    FaceError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

// Message shown for every persistence failure; details go to the log only
constexpr const char* PERSISTENCE_FAILURE_MESSAGE = "Database operation failed. Please try again later.";

} // namespace gymface

#endif // GYMFACE_ERRORS_H
