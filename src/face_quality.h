#ifndef GYMFACE_FACE_QUALITY_H
#define GYMFACE_FACE_QUALITY_H

#include "face_model.h"
#include "image.h"
#include <string>
#include <vector>

namespace gymface {

struct QualityReport {
    double score = 0.0;        // [0,1]
    double face_ratio = 0.0;   // face box area / image area
    double brightness = 0.0;   // grayscale mean of the frame
    double sharpness = 0.0;    // Laplacian variance of the frame
    std::vector<std::string> issues;
};

// Capture-quality feedback for enrollment UIs. Advisory only; it never rejects.
class FaceQualityScorer {
public:
    explicit FaceQualityScorer(double min_face_ratio);

    QualityReport assess(const ImageView& image, const FaceDetection& face) const;

private:
    double min_face_ratio_;
};

} // namespace gymface

#endif // GYMFACE_FACE_QUALITY_H
