#ifndef GYMFACE_HUMAN_FACE_VALIDATOR_H
#define GYMFACE_HUMAN_FACE_VALIDATOR_H

#include "face_model.h"
#include "liveness_detector.h"
#include "settings.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gymface {

constexpr const char* ERROR_INVALID_HUMAN_FACE = "The detected face does not look like a valid human face";
constexpr const char* ERROR_INVALID_FACE_ANGLE = "Face angle is too extreme. Please look directly at the camera";
constexpr const char* ERROR_FACE_TOO_SMALL = "Face is too small in the image. Please move closer to the camera";

// Result of one validation step: nullopt = passed, otherwise the rejection message
using ValidationOutcome = std::optional<std::string>;

struct FaceValidationCheck {
    std::string name;
    // image width/height are passed alongside the detection
    std::function<ValidationOutcome(const FaceDetection&, int, int)> run;  // may throw
    FailurePolicy policy = FailurePolicy::Closed;
    std::string failure_message;  // used when the check throws under FailurePolicy::Closed
};

struct FaceValidationResult {
    bool is_valid = true;
    std::string reason;
    std::string failed_check;
};

// Ordered checks: characteristics, size, angle, landmarks. First failure wins.
// Angle estimation fails open; every other step fails closed.
class HumanFaceValidator {
public:
    explicit HumanFaceValidator(const ValidationSettings& settings);

    HumanFaceValidator(const HumanFaceValidator&) = delete;
    HumanFaceValidator& operator=(const HumanFaceValidator&) = delete;

    FaceValidationResult validate(const FaceDetection& face, int image_width, int image_height) const;

    ValidationOutcome checkCharacteristics(const FaceDetection& face) const;
    ValidationOutcome checkSize(const FaceDetection& face, int image_width, int image_height) const;
    ValidationOutcome checkAngle(const FaceDetection& face) const;
    ValidationOutcome checkLandmarks(const FaceDetection& face) const;

    // Roll/tilt estimate in degrees from eyes and nose; needs 3+ landmarks
    static double estimateAngle(const std::vector<Point>& landmarks);

    const std::vector<FaceValidationCheck>& checks() const { return checks_; }
    void setChecks(std::vector<FaceValidationCheck> checks) { checks_ = std::move(checks); }

private:
    ValidationSettings settings_;
    std::vector<FaceValidationCheck> checks_;
};

} // namespace gymface

#endif // GYMFACE_HUMAN_FACE_VALIDATOR_H
