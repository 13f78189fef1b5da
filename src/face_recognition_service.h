#ifndef GYMFACE_FACE_RECOGNITION_SERVICE_H
#define GYMFACE_FACE_RECOGNITION_SERVICE_H

#include "biometric_store.h"
#include "embedding_comparator.h"
#include "errors.h"
#include "face_extractor.h"
#include "face_quality.h"
#include "human_face_validator.h"
#include "image_decoder.h"
#include "liveness_detector.h"
#include "settings.h"
#include "subject_directory.h"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace gymface {

// Common shape of every service result. Nothing is thrown past the service.
struct OperationResult {
    bool success = false;
    std::string error;
    ErrorKind error_kind = ErrorKind::None;
};

struct RegistrationResult : OperationResult {
    std::string record_id;
    std::string subject_id;
};

struct AuthenticationResult : OperationResult {
    std::string subject_id;
    std::optional<SubjectInfo> subject;
    double similarity = 0.0;
    double distance = 1.0;
};

struct DeletionResult : OperationResult {
    std::string message;
    size_t deactivated = 0;
};

struct FaceComparisonResult : OperationResult {
    bool match = false;
    double similarity = 0.0;
    double distance = 1.0;
    double confidence = 0.0;  // similarity clamped at 0
};

struct QualityAssessmentResult : OperationResult {
    QualityReport report;
};

struct DetectionResult : OperationResult {
    std::vector<FaceDetection> faces;
};

constexpr const char* ERROR_NO_MATCHING_FACE = "No matching face found";
constexpr const char* ERROR_SUBJECT_NOT_FOUND = "Subject not found";
constexpr const char* ERROR_SUBJECT_INACTIVE = "Subject is not active";
constexpr const char* FACE_DEACTIVATED_MESSAGE = "Face biometric deactivated successfully";

// Register / authenticate / update / delete / compare workflows over the
// decoder, liveness, extraction, validation and storage components.
// All collaborators are injected; calls are synchronous on the caller's thread.
class FaceRecognitionService {
public:
    FaceRecognitionService(const Settings& settings,
                           std::shared_ptr<const FaceModel> model,
                           std::shared_ptr<BiometricStore> store,
                           std::shared_ptr<SubjectDirectory> subjects);

    FaceRecognitionService(const FaceRecognitionService&) = delete;
    FaceRecognitionService& operator=(const FaceRecognitionService&) = delete;

    RegistrationResult registerFace(const std::string& subject_id, const std::string& image_base64);
    AuthenticationResult authenticate(const std::string& image_base64, std::optional<double> tolerance = std::nullopt);
    RegistrationResult updateFace(const std::string& subject_id, const std::string& image_base64);
    DeletionResult deleteFace(const std::string& subject_id);
    FaceComparisonResult compareTwo(const std::string& image_a, const std::string& image_b,
                                    std::optional<double> tolerance = std::nullopt);

    QualityAssessmentResult assessQuality(const std::string& image_base64);
    DetectionResult detectAll(const std::string& image_base64);

private:
    Settings settings_;
    ImageDecoder decoder_;
    LivenessDetector liveness_;
    FaceExtractor extractor_;
    HumanFaceValidator validator_;
    EmbeddingComparator comparator_;
    FaceQualityScorer quality_;
    std::shared_ptr<BiometricStore> store_;
    std::shared_ptr<SubjectDirectory> subjects_;

    RegistrationResult enroll(const std::string& subject_id, const std::string& image_base64,
                              const std::string& operation);
    // Enrollment is refused for unknown or disabled subjects
    void requireActiveSubject(const std::string& subject_id) const;
    Bytes makeThumbnailJpeg(const ImageView& image) const;
};

} // namespace gymface

#endif // GYMFACE_FACE_RECOGNITION_SERVICE_H
