#include "human_face_validator.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>

namespace gymface {

namespace {

constexpr size_t MIN_LANDMARKS = 5;
constexpr float MIN_LANDMARK_SPREAD = 10.0f;   // pixels, both axes
constexpr double MIN_BBOX_ASPECT = 0.5;
constexpr double MAX_BBOX_ASPECT = 2.0;
constexpr double RAD_TO_DEG = 180.0 / M_PI;

std::string fmt(double v, int precision) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(precision) << v;
    return ss.str();
}

// Profile faces produce extreme box aspect ratios
ValidationOutcome angleFromBoundingBox(const FaceDetection& face) {
    double aspect = face.bbox.height > 0
        ? static_cast<double>(face.bbox.width) / face.bbox.height
        : 1.0;

    if (aspect < MIN_BBOX_ASPECT || aspect > MAX_BBOX_ASPECT) {
        Logger::getInstance().warning("Extreme aspect ratio suggests profile: " + fmt(aspect, 2));
        return std::string(ERROR_INVALID_FACE_ANGLE);
    }
    return std::nullopt;
}

} // namespace

HumanFaceValidator::HumanFaceValidator(const ValidationSettings& settings)
    : settings_(settings) {
    checks_ = {
        {"characteristics",
         [this](const FaceDetection& f, int, int) { return checkCharacteristics(f); },
         FailurePolicy::Closed,
         std::string(ERROR_INVALID_HUMAN_FACE) + ". Validation error"},
        {"size",
         [this](const FaceDetection& f, int w, int h) { return checkSize(f, w, h); },
         FailurePolicy::Closed,
         ERROR_FACE_TOO_SMALL},
        {"angle",
         [this](const FaceDetection& f, int, int) { return checkAngle(f); },
         FailurePolicy::Open,
         ERROR_INVALID_FACE_ANGLE},
        {"landmarks",
         [this](const FaceDetection& f, int, int) { return checkLandmarks(f); },
         FailurePolicy::Closed,
         std::string(ERROR_INVALID_HUMAN_FACE) + ". Landmark validation error"},
    };
}

ValidationOutcome HumanFaceValidator::checkCharacteristics(const FaceDetection& face) const {
    if (face.age) {
        const int age = *face.age;
        if (age < settings_.min_age || age > settings_.max_age) {
            Logger::getInstance().warning("Invalid age detected: " + std::to_string(age) +
                " (expected " + std::to_string(settings_.min_age) + "-" + std::to_string(settings_.max_age) + ")");
            return std::string(ERROR_INVALID_HUMAN_FACE) + ". Estimated age out of range (" +
                std::to_string(age) + " years)";
        }
    }

    if (face.gender) {
        const int code = static_cast<int>(*face.gender);
        if (code != static_cast<int>(Gender::Female) && code != static_cast<int>(Gender::Male)) {
            Logger::getInstance().warning("Invalid gender value: " + std::to_string(code));
            return std::string(ERROR_INVALID_HUMAN_FACE) + ". Invalid gender estimate";
        }
    }

    if (!face.landmarks.empty() && face.landmarks.size() < MIN_LANDMARKS) {
        Logger::getInstance().warning("Invalid landmarks: " + std::to_string(face.landmarks.size()) + " points");
        return std::string(ERROR_INVALID_HUMAN_FACE) + ". Insufficient facial landmarks";
    }

    return std::nullopt;
}

ValidationOutcome HumanFaceValidator::checkSize(const FaceDetection& face, int image_width, int image_height) const {
    const double image_area = static_cast<double>(image_width) * image_height;
    const double ratio = image_area > 0 ? static_cast<double>(face.bbox.area()) / image_area : 0.0;

    if (ratio < settings_.min_face_size_ratio) {
        Logger::getInstance().warning("Face too small: ratio=" + fmt(ratio, 4) +
            " (min: " + fmt(settings_.min_face_size_ratio, 4) + ")");
        return std::string(ERROR_FACE_TOO_SMALL);
    }

    Logger::getInstance().debug("Face size validation passed: ratio=" + fmt(ratio, 4));
    return std::nullopt;
}

double HumanFaceValidator::estimateAngle(const std::vector<Point>& landmarks) {
    if (landmarks.size() < 3) {
        throw std::invalid_argument("angle estimation needs eye and nose landmarks");
    }

    // [left_eye, right_eye, nose, left_mouth, right_mouth]
    const Point& left_eye = landmarks[0];
    const Point& right_eye = landmarks[1];
    const Point& nose = landmarks[2];

    const double dx = right_eye.x - left_eye.x;
    const double dy = right_eye.y - left_eye.y;
    double angle = std::atan2(std::abs(dy), std::abs(dx)) * RAD_TO_DEG;

    const double eye_center_y = (left_eye.y + right_eye.y) / 2.0;
    const double vertical_offset = std::abs(nose.y - eye_center_y);
    const double eye_distance = std::sqrt(dx * dx + dy * dy);

    if (eye_distance > 0) {
        double tilt = std::atan2(vertical_offset, eye_distance) * RAD_TO_DEG;
        angle = std::max(angle, tilt);
    }

    return angle;
}

ValidationOutcome HumanFaceValidator::checkAngle(const FaceDetection& face) const {
    if (face.landmarks.size() < MIN_LANDMARKS) {
        Logger::getInstance().warning("Landmarks not available for angle calculation, using bounding box");
        return angleFromBoundingBox(face);
    }

    const double angle = estimateAngle(face.landmarks);

    if (angle > settings_.max_face_angle) {
        Logger::getInstance().warning("Face angle too large: " + fmt(angle, 2) +
            " deg (max: " + fmt(settings_.max_face_angle, 1) + " deg)");
        return std::string(ERROR_INVALID_FACE_ANGLE);
    }

    Logger::getInstance().debug("Face angle validation passed: " + fmt(angle, 2) + " deg");
    return std::nullopt;
}

ValidationOutcome HumanFaceValidator::checkLandmarks(const FaceDetection& face) const {
    if (face.landmarks.empty()) {
        Logger::getInstance().warning("Landmarks not available");
        return std::string(ERROR_INVALID_HUMAN_FACE) + ". Facial landmarks not available";
    }
    if (face.landmarks.size() < MIN_LANDMARKS) {
        Logger::getInstance().warning("Insufficient landmarks: " + std::to_string(face.landmarks.size()));
        return std::string(ERROR_INVALID_HUMAN_FACE) + ". Insufficient facial landmarks (" +
            std::to_string(face.landmarks.size()) + ")";
    }

    auto [min_x, max_x] = std::minmax_element(face.landmarks.begin(), face.landmarks.end(),
        [](const Point& a, const Point& b) { return a.x < b.x; });
    auto [min_y, max_y] = std::minmax_element(face.landmarks.begin(), face.landmarks.end(),
        [](const Point& a, const Point& b) { return a.y < b.y; });

    const float x_spread = max_x->x - min_x->x;
    const float y_spread = max_y->y - min_y->y;

    // Clustered points come from detection artifacts
    if (x_spread < MIN_LANDMARK_SPREAD || y_spread < MIN_LANDMARK_SPREAD) {
        Logger::getInstance().warning("Landmarks too clustered: x_spread=" + fmt(x_spread, 2) +
            ", y_spread=" + fmt(y_spread, 2));
        return std::string(ERROR_INVALID_HUMAN_FACE) + ". Facial landmarks are poorly distributed";
    }

    return std::nullopt;
}

FaceValidationResult HumanFaceValidator::validate(const FaceDetection& face, int image_width, int image_height) const {
    FaceValidationResult result;

    for (const auto& check : checks_) {
        ValidationOutcome outcome;
        try {
            outcome = check.run(face, image_width, image_height);
        } catch (const std::exception& e) {
            Logger::getInstance().error("Face validation check '" + check.name + "' failed: " + e.what());
            if (check.policy == FailurePolicy::Open) {
                continue;
            }
            outcome = check.failure_message;
        }

        if (outcome) {
            result.is_valid = false;
            result.reason = *outcome;
            result.failed_check = check.name;
            return result;
        }
    }

    Logger::getInstance().debug("Face validation passed");
    return result;
}

} // namespace gymface
