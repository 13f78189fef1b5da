#ifndef GYMFACE_FACE_EXTRACTOR_H
#define GYMFACE_FACE_EXTRACTOR_H

#include "face_model.h"
#include <memory>

namespace gymface {

constexpr const char* ERROR_NO_FACE_DETECTED = "No face detected in the image";
constexpr const char* ERROR_MULTIPLE_FACES = "Multiple faces detected in the image. Please provide an image with only one face";

// Applies the detection contract on top of a FaceModel
class FaceExtractor {
public:
    FaceExtractor(std::shared_ptr<const FaceModel> model, size_t embedding_dimensions);

    // Exactly one face or FaceError(DetectionFailure); embedding length is verified
    FaceDetection extractSingle(const ImageView& image) const;

    // Every face (possibly none), for group photos
    std::vector<FaceDetection> extractAll(const ImageView& image) const;

    const FaceModel& model() const { return *model_; }

private:
    std::shared_ptr<const FaceModel> model_;
    size_t embedding_dimensions_;

    void checkEmbedding(const FaceDetection& face) const;
};

} // namespace gymface

#endif // GYMFACE_FACE_EXTRACTOR_H
