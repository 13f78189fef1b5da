#include "face_extractor.h"
#include "errors.h"
#include "logger.h"
#include <cmath>

namespace gymface {

FaceExtractor::FaceExtractor(std::shared_ptr<const FaceModel> model, size_t embedding_dimensions)
    : model_(std::move(model)), embedding_dimensions_(embedding_dimensions) {
    if (!model_) {
        throw std::invalid_argument("FaceExtractor requires a face model");
    }
    if (model_->embeddingDimension() != embedding_dimensions_) {
        Logger::getInstance().warning("Face model " + model_->modelName() + " produces " +
            std::to_string(model_->embeddingDimension()) + "D embeddings but " +
            std::to_string(embedding_dimensions_) + "D are configured");
    }
}

void FaceExtractor::checkEmbedding(const FaceDetection& face) const {
    if (face.embedding.size() != embedding_dimensions_) {
        throw FaceError(ErrorKind::InputValidation,
            "Expected " + std::to_string(embedding_dimensions_) + "-dimensional embedding, got " +
            std::to_string(face.embedding.size()) + " dimensions");
    }
    for (double v : face.embedding) {
        if (!std::isfinite(v)) {
            throw FaceError(ErrorKind::DetectionFailure, "Face embedding contains invalid values");
        }
    }
}

FaceDetection FaceExtractor::extractSingle(const ImageView& image) const {
    std::vector<FaceDetection> faces = model_->detect(image);

    if (faces.empty()) {
        throw FaceError(ErrorKind::DetectionFailure, ERROR_NO_FACE_DETECTED);
    }
    if (faces.size() > 1) {
        Logger::getInstance().info("Refusing image with " + std::to_string(faces.size()) + " faces");
        throw FaceError(ErrorKind::DetectionFailure, ERROR_MULTIPLE_FACES);
    }

    checkEmbedding(faces.front());

    const FaceDetection& face = faces.front();
    Logger::getInstance().debug("Face extracted: bbox=(" + std::to_string(face.bbox.x) + "," +
        std::to_string(face.bbox.y) + "," + std::to_string(face.bbox.width) + "x" +
        std::to_string(face.bbox.height) + ") confidence=" + std::to_string(face.confidence));

    return std::move(faces.front());
}

std::vector<FaceDetection> FaceExtractor::extractAll(const ImageView& image) const {
    std::vector<FaceDetection> faces = model_->detect(image);
    for (const auto& face : faces) {
        checkEmbedding(face);
    }
    Logger::getInstance().debug("Bulk extraction found " + std::to_string(faces.size()) + " face(s)");
    return faces;
}

} // namespace gymface
