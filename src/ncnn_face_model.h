#ifndef GYMFACE_NCNN_FACE_MODEL_H
#define GYMFACE_NCNN_FACE_MODEL_H

#include "face_model.h"
#include "settings.h"
#include "detectors/common.h"
#include <ncnn/net.h>
#include <string>
#include <vector>

namespace gymface {

// Detection model types (auto-detected from .param file structure)
enum class DetectionModelType {
    RETINAFACE,   // input="data", outputs=face_rpn_*
    SCRFD,        // input="input.1", outputs=score_*/bbox_*/kps_*
    UNKNOWN
};

// ncnn-backed FaceModel: detector (SCRFD or RetinaFace) + 5-point alignment
// + ArcFace-style recognition network + optional gender/age network.
//
// Models are resolved from [recognition] settings. Empty paths fall back to
// <models_dir>/detection, <models_dir>/recognition and <models_dir>/genderage
// (each as .param/.bin or .ncnn.param/.ncnn.bin).
//
// Inference creates one ncnn::Extractor per call, so a loaded instance can be
// shared by concurrent request threads.
class NcnnFaceModel : public FaceModel {
public:
    explicit NcnnFaceModel(const RecognitionSettings& settings);

    NcnnFaceModel(const NcnnFaceModel&) = delete;
    NcnnFaceModel& operator=(const NcnnFaceModel&) = delete;

    // Loads every network; throws FaceError(Unexpected) if detection or recognition is missing
    void loadModels();

    std::vector<FaceDetection> detect(const ImageView& image) const override;
    size_t embeddingDimension() const override { return encoding_dim_; }
    std::string modelName() const override;

    bool hasGenderAge() const { return genderage_loaded_; }

    // Helper: parse param file to extract the recognition output dimension (0 if unknown)
    static size_t parseModelOutputDim(const std::string& param_path);

    // Helper: auto-detect detection model type from param file
    static DetectionModelType detectModelType(const std::string& param_path);

private:
    RecognitionSettings settings_;

    ncnn::Net detection_net_;
    ncnn::Net recognition_net_;
    ncnn::Net genderage_net_;

    DetectionModelType detection_type_ = DetectionModelType::UNKNOWN;
    bool models_loaded_ = false;
    bool genderage_loaded_ = false;

    size_t encoding_dim_ = 0;
    std::string detection_model_name_;
    std::string recognition_model_name_;

    std::vector<FaceObject> detectFaces(const ImageView& image) const;
    Image alignFace(const ImageView& image, const FaceObject& face) const;
    Embedding encodeFace(const Image& aligned) const;
    void estimateGenderAge(const ImageView& image, const FaceObject& face, FaceDetection& out) const;
};

} // namespace gymface

#endif // GYMFACE_NCNN_FACE_MODEL_H
