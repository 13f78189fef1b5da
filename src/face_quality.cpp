#include "face_quality.h"
#include "image_ops.h"
#include "logger.h"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace gymface {

namespace {

constexpr double MAX_FACE_RATIO = 0.8;
constexpr double DARK_LIMIT = 70.0;
constexpr double BRIGHT_LIMIT = 180.0;
constexpr double GOOD_LIGHT_MIN = 80.0;
constexpr double GOOD_LIGHT_MAX = 160.0;
constexpr double IDEAL_BRIGHTNESS = 120.0;
constexpr double BLUR_LIMIT = 150.0;
constexpr double SOFT_LIMIT = 300.0;
constexpr double SHARPNESS_NORMALIZER = 600.0;

} // namespace

FaceQualityScorer::FaceQualityScorer(double min_face_ratio)
    : min_face_ratio_(min_face_ratio) {
}

QualityReport FaceQualityScorer::assess(const ImageView& image, const FaceDetection& face) const {
    QualityReport report;

    const double image_area = static_cast<double>(image.pixelCount());
    report.face_ratio = image_area > 0 ? static_cast<double>(face.bbox.area()) / image_area : 0.0;

    if (report.face_ratio < min_face_ratio_) {
        report.issues.push_back("Face is too small, move closer");
    } else if (report.face_ratio > MAX_FACE_RATIO) {
        report.issues.push_back("Face is too close to the camera");
    }

    // Lighting and focus are judged on the whole frame
    cv::Mat gray;
    cv::cvtColor(asMat(image), gray, cv::COLOR_BGR2GRAY);

    report.brightness = cv::mean(gray)[0];
    if (report.brightness < DARK_LIMIT) {
        report.issues.push_back("Image is too dark");
    } else if (report.brightness > BRIGHT_LIMIT) {
        report.issues.push_back("Image is too bright");
    } else if (report.brightness < GOOD_LIGHT_MIN || report.brightness > GOOD_LIGHT_MAX) {
        report.issues.push_back("Lighting could be improved");
    }

    cv::Mat lap;
    cv::Laplacian(gray, lap, CV_64F);
    cv::Scalar mean, stddev;
    cv::meanStdDev(lap, mean, stddev);
    report.sharpness = stddev[0] * stddev[0];
    if (report.sharpness < BLUR_LIMIT) {
        report.issues.push_back("Image is blurry");
    } else if (report.sharpness < SOFT_LIMIT) {
        report.issues.push_back("Image could be sharper");
    }

    const double size_score = std::min(report.face_ratio * 10.0, 1.0);
    const double light_score = std::max(0.0, 1.0 - std::abs(report.brightness - IDEAL_BRIGHTNESS) / IDEAL_BRIGHTNESS);
    const double sharp_score = std::min(report.sharpness / SHARPNESS_NORMALIZER, 1.0);
    report.score = (size_score + light_score + sharp_score) / 3.0;

    Logger::getInstance().debug("Quality: ratio=" + std::to_string(report.face_ratio) +
        " brightness=" + std::to_string(report.brightness) +
        " sharpness=" + std::to_string(report.sharpness) +
        " score=" + std::to_string(report.score));

    return report;
}

} // namespace gymface
