#include "liveness_detector.h"
#include "image_ops.h"
#include "logger.h"
#include <opencv2/imgproc.hpp>
#include <opencv2/core.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>
#include <iomanip>
#include <stdexcept>

namespace gymface {

using namespace liveness_defaults;

namespace {

std::string fmt3(double v) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3) << v;
    return ss.str();
}

cv::Mat grayOf(const ImageView& image) {
    if (image.empty() || image.channels() != 3) {
        throw std::invalid_argument("liveness analysis expects a 3-channel image");
    }
    cv::Mat gray;
    cv::cvtColor(asMat(image), gray, cv::COLOR_BGR2GRAY);
    return gray;
}

double resolutionFactor(const cv::Mat& gray) {
    double pixels = static_cast<double>(gray.rows) * gray.cols;
    return std::max(pixels / BASE_RESOLUTION, MIN_RESOLUTION_FACTOR);
}

double variance(const cv::Mat& m) {
    cv::Scalar mean, stddev;
    cv::meanStdDev(m, mean, stddev);
    return stddev[0] * stddev[0];
}

// High-pass (Laplacian) response variance; printed photos carry less micro-texture
double textureScore(const cv::Mat& gray) {
    cv::Mat lap;
    cv::Laplacian(gray, lap, CV_64F);
    return std::min(variance(lap) / (TEXTURE_NORMALIZER * resolutionFactor(gray)), 1.0);
}

// Gradient-magnitude variance as a depth proxy; flat prints have less
double depthScore(const cv::Mat& gray) {
    cv::Mat gx, gy, magnitude;
    cv::Sobel(gray, gx, CV_64F, 1, 0, 3);
    cv::Sobel(gray, gy, CV_64F, 0, 1, 3);
    cv::magnitude(gx, gy, magnitude);
    return std::min(variance(magnitude) / (DEPTH_NORMALIZER * resolutionFactor(gray)), 1.0);
}

cv::Mat cannyEdges(const cv::Mat& gray) {
    cv::Mat edges;
    cv::Canny(gray, edges, 50, 150);
    return edges;
}

double edgeScore(const cv::Mat& edges) {
    double density = static_cast<double>(cv::countNonZero(edges)) / (edges.rows * edges.cols);
    if (density < 0.05) return 0.3;   // too few edges
    if (density > 0.3) return 0.6;    // too many (compression or moire)
    return 0.8;
}

// A 4-corner contour touching the outer margin and covering a large part of the frame (device bezel)
bool hasRectangularBorder(const cv::Mat& edges) {
    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(edges.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    const double width = edges.cols;
    const double height = edges.rows;
    const double image_area = width * height;

    for (const auto& contour : contours) {
        std::vector<cv::Point> approx;
        cv::approxPolyDP(contour, approx, 0.02 * cv::arcLength(contour, true), true);
        if (approx.size() != 4) continue;

        cv::Rect r = cv::boundingRect(contour);
        bool near_edge = r.x < width * 0.1 || (r.x + r.width) > width * 0.9 ||
                         r.y < height * 0.1 || (r.y + r.height) > height * 0.9;
        double area_ratio = (static_cast<double>(r.width) * r.height) / image_area;
        if (near_edge && area_ratio > 0.3) {
            return true;
        }
    }
    return false;
}

// Screens light the scene evenly; low brightness spread is screen-like
double reflectionScore(const cv::Mat& gray) {
    cv::Scalar mean, stddev;
    cv::meanStdDev(gray, mean, stddev);
    return std::min(stddev[0] / 50.0, 1.0);
}

// Mean spectral magnitude in a window around the (shifted) spectrum center
double gridScore(const cv::Mat& gray) {
    const int h = gray.rows;
    const int w = gray.cols;
    const int cy = h / 2;
    const int cx = w / 2;

    const int y_from = std::max(-GRID_WINDOW, -cy), y_to = std::min(GRID_WINDOW, h - cy);
    const int x_from = std::max(-GRID_WINDOW, -cx), x_to = std::min(GRID_WINDOW, w - cx);
    if (y_to <= y_from || x_to <= x_from) {
        return 0.3;
    }

    cv::Mat real;
    gray.convertTo(real, CV_64F);
    cv::Mat spectrum;
    cv::dft(real, spectrum, cv::DFT_COMPLEX_OUTPUT);

    // Shifted index (c + d) is unshifted frequency (d mod n)
    double sum = 0.0;
    int count = 0;
    for (int dy = y_from; dy < y_to; dy++) {
        const int fy = (dy % h + h) % h;
        const cv::Vec2d* row = spectrum.ptr<cv::Vec2d>(fy);
        for (int dx = x_from; dx < x_to; dx++) {
            const int fx = (dx % w + w) % w;
            sum += std::hypot(row[fx][0], row[fx][1]);
            count++;
        }
    }

    return std::min((sum / count) / 10000.0, 1.0);
}

double brightnessScore(const cv::Mat& gray) {
    return variance(gray) < SCREEN_VARIANCE_CUTOFF ? 0.8 : 0.3;
}

} // namespace

LivenessDetector::LivenessDetector(const AntiSpoofingSettings& settings)
    : settings_(settings) {
    checks_ = {
        {"photo_attack",
         [this](const ImageView& img) { return detectPhotoAttack(img); },
         FailurePolicy::Open,
         "Photo attack detected. Please use a live camera capture"},
        {"phone_screen",
         [this](const ImageView& img) { return detectPhoneScreen(img); },
         FailurePolicy::Open,
         "Phone screen attack detected. Please use a live camera capture"},
        {"screen_attack",
         [this](const ImageView& img) { return detectScreenAttack(img); },
         FailurePolicy::Open,
         "Screen attack detected. Please use a live camera capture"},
    };
}

LivenessSignal LivenessDetector::detectPhotoAttack(const ImageView& image) const {
    cv::Mat gray = grayOf(image);

    const double texture = textureScore(gray);
    const double depth = depthScore(gray);
    const double edge = edgeScore(cannyEdges(gray));
    const double combined = (texture + depth + edge) / 3.0;

    // Low-resolution sensors show less texture, so the bar rises with resolution (0.3 .. 0.4)
    const double pixels = static_cast<double>(gray.rows) * gray.cols;
    const double threshold = PHOTO_THRESHOLD_BASE +
        PHOTO_THRESHOLD_RANGE * std::min(pixels / THRESHOLD_RESOLUTION, 1.0);

    if (combined < threshold) {
        Logger::getInstance().warning("Photo attack suspected: texture=" + fmt3(texture) +
            " depth=" + fmt3(depth) + " edge=" + fmt3(edge) + " combined=" + fmt3(combined) +
            " threshold=" + fmt3(threshold));
        return {true, 1.0 - combined};
    }

    Logger::getInstance().debug("Photo attack check passed: combined=" + fmt3(combined));
    return {false, combined};
}

LivenessSignal LivenessDetector::detectPhoneScreen(const ImageView& image) const {
    cv::Mat gray = grayOf(image);

    const bool border = hasRectangularBorder(cannyEdges(gray));
    const double reflection = reflectionScore(gray);
    const double grid = gridScore(gray);
    const double brightness = brightnessScore(gray);

    const bool indicators[] = {
        border,
        reflection < 0.4,
        grid > 0.6,
        brightness > 0.6,
    };
    int hits = 0;
    for (bool indicator : indicators) {
        if (indicator) hits++;
    }
    const double share = hits / 4.0;

    if (share > PHONE_CONFIDENCE_CUTOFF) {
        Logger::getInstance().warning("Phone screen suspected: border=" + std::to_string(border) +
            " reflection=" + fmt3(reflection) + " grid=" + fmt3(grid) +
            " brightness=" + fmt3(brightness) + " confidence=" + fmt3(share));
        return {true, share};
    }

    return {false, 1.0 - share};
}

LivenessSignal LivenessDetector::detectUniformBrightness(const ImageView& image) const {
    const double brightness_variance = variance(grayOf(image));
    if (brightness_variance < SCREEN_VARIANCE_CUTOFF) {
        Logger::getInstance().warning("Screen-like uniform brightness: variance=" + fmt3(brightness_variance));
        return {true, 0.7};
    }

    return {false, 0.3};
}

LivenessSignal LivenessDetector::combineScreenSignals(const std::optional<LivenessSignal>& phone,
                                                      const LivenessSignal& uniform) {
    if (phone && phone->is_attack) {
        return *phone;
    }
    return uniform;
}

LivenessSignal LivenessDetector::detectScreenAttack(const ImageView& image) const {
    // The phone sub-check fails open on its own so the brightness test still runs
    std::optional<LivenessSignal> phone;
    try {
        phone = detectPhoneScreen(image);
    } catch (const std::exception& e) {
        Logger::getInstance().error(std::string("Phone screen sub-check unavailable: ") + e.what());
    }

    return combineScreenSignals(phone, detectUniformBrightness(image));
}

std::optional<LivenessSignal> LivenessDetector::runCheck(const LivenessCheck& check, const ImageView& image) {
    try {
        return check.run(image);
    } catch (const std::exception& e) {
        Logger::getInstance().error("Liveness check '" + check.name + "' unavailable: " + e.what());
        return std::nullopt;
    }
}

LivenessVerdict LivenessDetector::checkLiveness(const ImageView& image) const {
    LivenessVerdict verdict;

    if (!settings_.enabled) {
        Logger::getInstance().debug("Anti-spoofing is disabled");
        return verdict;
    }

    for (const auto& check : checks_) {
        std::optional<LivenessSignal> signal = runCheck(check, image);

        if (!signal) {
            if (check.policy == FailurePolicy::Open) {
                signal = LivenessSignal{false, NEUTRAL_CONFIDENCE};
            } else {
                verdict.is_live = false;
                verdict.reason = check.rejection_message;
                verdict.failed_check = check.name;
                return verdict;
            }
        }

        if (signal->is_attack && signal->confidence >= settings_.min_liveness_score) {
            verdict.is_live = false;
            verdict.reason = check.rejection_message;
            verdict.failed_check = check.name;
            Logger::getInstance().warning("Liveness rejected by " + check.name +
                " (confidence " + fmt3(signal->confidence) + ")");
            return verdict;
        }
    }

    Logger::getInstance().debug("Liveness check passed");
    return verdict;
}

} // namespace gymface
