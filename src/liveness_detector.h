#ifndef GYMFACE_LIVENESS_DETECTOR_H
#define GYMFACE_LIVENESS_DETECTOR_H

#include "image.h"
#include "settings.h"
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gymface {

// Outcome of one anti-spoofing heuristic
struct LivenessSignal {
    bool is_attack = false;
    double confidence = 0.0;  // [0,1]; certainty of the is_attack verdict
};

// What the aggregate does when a check cannot produce a signal
enum class FailurePolicy {
    Open,    // treat as "not an attack" with neutral confidence
    Closed   // treat as a rejection
};

struct LivenessCheck {
    std::string name;
    std::function<LivenessSignal(const ImageView&)> run;  // may throw
    FailurePolicy policy = FailurePolicy::Open;
    std::string rejection_message;
};

struct LivenessVerdict {
    bool is_live = true;
    std::string reason;        // rejection message when !is_live
    std::string failed_check;  // name of the check that rejected
};

// Heuristic thresholds. Empirical starting points, expected to be re-tuned on field data.
namespace liveness_defaults {
constexpr double TEXTURE_NORMALIZER = 1000.0;
constexpr double DEPTH_NORMALIZER = 5000.0;
constexpr double BASE_RESOLUTION = 307200.0;       // 640x480
constexpr double THRESHOLD_RESOLUTION = 480000.0;
constexpr double MIN_RESOLUTION_FACTOR = 0.3;
constexpr double PHOTO_THRESHOLD_BASE = 0.3;
constexpr double PHOTO_THRESHOLD_RANGE = 0.1;
constexpr double PHONE_CONFIDENCE_CUTOFF = 0.5;
constexpr double SCREEN_VARIANCE_CUTOFF = 500.0;
constexpr double NEUTRAL_CONFIDENCE = 0.5;
constexpr int GRID_WINDOW = 20;
}

class LivenessDetector {
public:
    explicit LivenessDetector(const AntiSpoofingSettings& settings);

    // The default check table binds to this instance
    LivenessDetector(const LivenessDetector&) = delete;
    LivenessDetector& operator=(const LivenessDetector&) = delete;

    // Runs photo, phone-screen and screen checks in order; passes when anti-spoofing is disabled
    LivenessVerdict checkLiveness(const ImageView& image) const;

    // Individual heuristics on a 3-channel BGR image. They throw on internal failure;
    // checkLiveness() resolves that through each check's FailurePolicy.
    LivenessSignal detectPhotoAttack(const ImageView& image) const;
    LivenessSignal detectPhoneScreen(const ImageView& image) const;
    LivenessSignal detectScreenAttack(const ImageView& image) const;
    LivenessSignal detectUniformBrightness(const ImageView& image) const;

    // Screen verdict from the phone sub-check (nullopt when it failed) and the brightness test
    static LivenessSignal combineScreenSignals(const std::optional<LivenessSignal>& phone,
                                               const LivenessSignal& uniform);

    // Policy table used by checkLiveness()
    const std::vector<LivenessCheck>& checks() const { return checks_; }
    void setChecks(std::vector<LivenessCheck> checks) { checks_ = std::move(checks); }

    // nullopt when the check threw (signal unavailable)
    static std::optional<LivenessSignal> runCheck(const LivenessCheck& check, const ImageView& image);

private:
    AntiSpoofingSettings settings_;
    std::vector<LivenessCheck> checks_;
};

} // namespace gymface

#endif // GYMFACE_LIVENESS_DETECTOR_H
