#include "ncnn_face_model.h"
#include "detectors/detectors.h"
#include "image_ops.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <regex>

namespace gymface {

namespace {

constexpr int ALIGNED_SIZE = 112;     // ArcFace input
constexpr int GENDERAGE_SIZE = 96;    // insightface genderage input

// Standard 5-point positions for a 112x112 aligned face
// [left_eye, right_eye, nose, left_mouth_corner, right_mouth_corner]
const Point kReferenceLandmarks[5] = {
    Point(38.2946f, 51.6963f),
    Point(73.5318f, 51.5014f),
    Point(56.0252f, 71.7366f),
    Point(41.5493f, 92.3655f),
    Point(70.7299f, 92.2041f)
};

struct ModelFiles {
    std::string param;
    std::string bin;
    std::string name;
};

bool fileExists(const std::string& path) {
    std::ifstream f(path);
    return f.good();
}

// Resolve "<base>.param/.bin", then "<base>.ncnn.param/.ncnn.bin"
bool resolveModel(const std::string& base, ModelFiles& out) {
    if (base.empty()) return false;

    size_t last_slash = base.find_last_of("/\\");
    out.name = (last_slash != std::string::npos) ? base.substr(last_slash + 1) : base;

    if (fileExists(base + ".param") && fileExists(base + ".bin")) {
        out.param = base + ".param";
        out.bin = base + ".bin";
        return true;
    }
    if (fileExists(base + ".ncnn.param") && fileExists(base + ".ncnn.bin")) {
        out.param = base + ".ncnn.param";
        out.bin = base + ".ncnn.bin";
        return true;
    }
    return false;
}

bool loadNet(ncnn::Net& net, const ModelFiles& files) {
    // CPU inference; Vulkan device selection is not wanted on servers
    net.opt.use_vulkan_compute = false;
    net.opt.num_threads = 4;
    net.opt.use_fp16_packed = false;
    net.opt.use_fp16_storage = false;

    int ret = net.load_param(files.param.c_str());
    if (ret != 0) {
        Logger::getInstance().error("Failed to load param file " + files.param + ", ret=" + std::to_string(ret));
        return false;
    }
    ret = net.load_model(files.bin.c_str());
    if (ret != 0) {
        Logger::getInstance().error("Failed to load model file " + files.bin + ", ret=" + std::to_string(ret));
        return false;
    }
    return true;
}

// Bilinear sample of a BGR pixel; black outside the frame
inline void sampleBilinear(const ImageView& src, float sx, float sy, uint8_t* dst) {
    const int x0 = static_cast<int>(std::floor(sx));
    const int y0 = static_cast<int>(std::floor(sy));
    const int x1 = x0 + 1;
    const int y1 = y0 + 1;

    if (x0 < 0 || y0 < 0 || x1 >= src.width() || y1 >= src.height()) {
        dst[0] = dst[1] = dst[2] = 0;
        return;
    }

    const float fx = sx - x0;
    const float fy = sy - y0;
    const uint8_t* base = src.data();
    const size_t stride = static_cast<size_t>(src.stride());

    for (int c = 0; c < 3; c++) {
        float p00 = base[y0 * stride + static_cast<size_t>(x0) * 3 + c];
        float p10 = base[y0 * stride + static_cast<size_t>(x1) * 3 + c];
        float p01 = base[y1 * stride + static_cast<size_t>(x0) * 3 + c];
        float p11 = base[y1 * stride + static_cast<size_t>(x1) * 3 + c];

        float val = p00 * (1 - fx) * (1 - fy) +
                    p10 * fx * (1 - fy) +
                    p01 * (1 - fx) * fy +
                    p11 * fx * fy;

        dst[c] = static_cast<uint8_t>(std::clamp(val, 0.0f, 255.0f));
    }
}

// Square crop of `side` pixels centered at (cx, cy), zero-filled outside the frame
Image centeredCrop(const ImageView& src, float cx, float cy, int side) {
    Image crop(side, side, 3);
    const int left = static_cast<int>(std::round(cx - side / 2.0f));
    const int top = static_cast<int>(std::round(cy - side / 2.0f));

    Rect region(left, top, side, side);
    region &= Rect(0, 0, src.width(), src.height());
    if (region.empty()) {
        return crop;
    }

    for (int y = 0; y < region.height; y++) {
        std::memcpy(crop.data() + static_cast<size_t>(region.y - top + y) * crop.stride() + (region.x - left) * 3,
                    src.data() + static_cast<size_t>(region.y + y) * src.stride() + static_cast<size_t>(region.x) * 3,
                    static_cast<size_t>(region.width) * 3);
    }
    return crop;
}

} // namespace

NcnnFaceModel::NcnnFaceModel(const RecognitionSettings& settings)
    : settings_(settings), encoding_dim_(settings.embedding_dimensions) {
}

size_t NcnnFaceModel::parseModelOutputDim(const std::string& param_path) {
    std::ifstream file(param_path);
    if (!file.is_open()) {
        Logger::getInstance().debug("Failed to open param file: " + param_path);
        return 0;
    }

    // Match: InnerProduct <name> 1 1 <in> out0 0=<dimension>
    std::regex output_pattern("InnerProduct\\s+\\S+\\s+\\d+\\s+\\d+\\s+\\S+\\s+out0\\s+0=(\\d+)");

    std::string line;
    while (std::getline(file, line)) {
        std::smatch match;
        if (std::regex_search(line, match, output_pattern)) {
            size_t dim = std::stoull(match[1].str());
            Logger::getInstance().debug("Detected output dimension: " + std::to_string(dim) + "D from " + param_path);
            return dim;
        }
    }

    return 0;
}

DetectionModelType NcnnFaceModel::detectModelType(const std::string& param_path) {
    std::ifstream file(param_path);
    if (!file.is_open()) {
        Logger::getInstance().debug("Failed to open detection param file: " + param_path);
        return DetectionModelType::UNKNOWN;
    }

    bool has_data_input = false;
    bool has_face_rpn = false;
    bool has_scrfd_input = false;
    bool has_scrfd_outputs = false;

    std::string line;
    while (std::getline(file, line)) {
        if (line.find("Input") != std::string::npos) {
            if (line.find(" data ") != std::string::npos) has_data_input = true;
            if (line.find(" input.1 ") != std::string::npos) has_scrfd_input = true;
        }
        if (line.find("face_rpn") != std::string::npos) has_face_rpn = true;
        if (line.find("score_8") != std::string::npos || line.find("bbox_8") != std::string::npos) {
            has_scrfd_outputs = true;
        }
    }

    if (has_data_input && has_face_rpn) {
        Logger::getInstance().debug("Detected RetinaFace model (input='data', outputs=face_rpn_*)");
        return DetectionModelType::RETINAFACE;
    }
    if (has_scrfd_input || has_scrfd_outputs) {
        Logger::getInstance().debug("Detected SCRFD model (input='input.1')");
        return DetectionModelType::SCRFD;
    }

    return DetectionModelType::UNKNOWN;
}

void NcnnFaceModel::loadModels() {
    const std::string dir = settings_.models_dir;

    // Detection
    ModelFiles det;
    std::string det_base = settings_.detection_model.empty() ? dir + "/detection" : settings_.detection_model;
    if (!resolveModel(det_base, det)) {
        throw FaceError(ErrorKind::Unexpected, "Detection model not found: " + det_base + ".{param,bin}");
    }
    detection_type_ = detectModelType(det.param);
    if (detection_type_ == DetectionModelType::UNKNOWN) {
        throw FaceError(ErrorKind::Unexpected, "Unsupported detection model: " + det.param);
    }
    if (!loadNet(detection_net_, det)) {
        throw FaceError(ErrorKind::Unexpected, "Failed to load detection model: " + det.name);
    }
    detection_model_name_ = det.name;

    // Recognition
    ModelFiles rec;
    std::string rec_base = settings_.recognition_model.empty() ? dir + "/recognition" : settings_.recognition_model;
    if (!resolveModel(rec_base, rec)) {
        throw FaceError(ErrorKind::Unexpected, "Recognition model not found: " + rec_base + ".{param,bin}");
    }
    size_t dim = parseModelOutputDim(rec.param);
    if (dim == 0) {
        Logger::getInstance().debug("Could not detect recognition output dimension, assuming " +
            std::to_string(settings_.embedding_dimensions) + "D");
        dim = settings_.embedding_dimensions;
    }
    if (!loadNet(recognition_net_, rec)) {
        throw FaceError(ErrorKind::Unexpected, "Failed to load recognition model: " + rec.name);
    }
    encoding_dim_ = dim;
    recognition_model_name_ = rec.name;

    // Gender/age (optional)
    ModelFiles ga;
    std::string ga_base = settings_.genderage_model.empty() ? dir + "/genderage" : settings_.genderage_model;
    if (resolveModel(ga_base, ga)) {
        genderage_loaded_ = loadNet(genderage_net_, ga);
    } else {
        Logger::getInstance().info("Gender/age model not found, age and gender checks will be skipped");
    }

    models_loaded_ = true;
    Logger::getInstance().info("Face models loaded: detection=" + detection_model_name_ +
        " (" + (detection_type_ == DetectionModelType::SCRFD ? "SCRFD" : "RetinaFace") + ")" +
        " recognition=" + recognition_model_name_ + " (" + std::to_string(encoding_dim_) + "D)" +
        " genderage=" + (genderage_loaded_ ? "yes" : "no"));
}

std::string NcnnFaceModel::modelName() const {
    return recognition_model_name_.empty() ? "unloaded" : recognition_model_name_;
}

std::vector<FaceObject> NcnnFaceModel::detectFaces(const ImageView& image) const {
    const int img_w = image.width();
    const int img_h = image.height();
    const int target = settings_.detection_size;

    // Longer side scaled to the detection size, then padded to a multiple of 32
    Letterbox box;
    box.orig_w = img_w;
    box.orig_h = img_h;
    box.scale = static_cast<float>(target) / std::max(img_w, img_h);
    const int w = std::max(1, static_cast<int>(img_w * box.scale));
    const int h = std::max(1, static_cast<int>(img_h * box.scale));

    ncnn::Mat in = ncnn::Mat::from_pixels_resize(image.data(), ncnn::Mat::PIXEL_BGR2RGB,
                                                 img_w, img_h, image.stride(), w, h);

    box.wpad = (w + 31) / 32 * 32 - w;
    box.hpad = (h + 31) / 32 * 32 - h;
    ncnn::Mat in_pad;
    ncnn::copy_make_border(in, in_pad, box.hpad / 2, box.hpad - box.hpad / 2,
                           box.wpad / 2, box.wpad - box.wpad / 2, ncnn::BORDER_CONSTANT, 0.f);

    const float threshold = static_cast<float>(settings_.detection_confidence);

    if (detection_type_ == DetectionModelType::SCRFD) {
        const float mean_vals[3] = {127.5f, 127.5f, 127.5f};
        const float norm_vals[3] = {1 / 128.f, 1 / 128.f, 1 / 128.f};
        in_pad.substract_mean_normalize(mean_vals, norm_vals);
        return detectWithSCRFD(detection_net_, in_pad, box, threshold);
    }

    return detectWithRetinaFace(detection_net_, in_pad, box, threshold);
}

Image NcnnFaceModel::alignFace(const ImageView& image, const FaceObject& face) const {
    if (face.landmarks.size() >= 5) {
        // Least-squares similarity transform (scale, rotation, translation) from the
        // detected landmarks onto the reference positions
        float src_cx = 0.f, src_cy = 0.f, dst_cx = 0.f, dst_cy = 0.f;
        for (int i = 0; i < 5; i++) {
            src_cx += face.landmarks[i].x;
            src_cy += face.landmarks[i].y;
            dst_cx += kReferenceLandmarks[i].x;
            dst_cy += kReferenceLandmarks[i].y;
        }
        src_cx /= 5.f; src_cy /= 5.f;
        dst_cx /= 5.f; dst_cy /= 5.f;

        float num_a = 0.f, num_b = 0.f, den = 0.f;
        for (int i = 0; i < 5; i++) {
            const float sx = face.landmarks[i].x - src_cx;
            const float sy = face.landmarks[i].y - src_cy;
            const float dx = kReferenceLandmarks[i].x - dst_cx;
            const float dy = kReferenceLandmarks[i].y - dst_cy;
            num_a += sx * dx + sy * dy;
            num_b += sx * dy - sy * dx;
            den += sx * sx + sy * sy;
        }

        if (den > 1.0f) {
            // dst = [a -b; b a] * src + t
            const float a = num_a / den;
            const float b = num_b / den;
            const float tx = dst_cx - (a * src_cx - b * src_cy);
            const float ty = dst_cy - (b * src_cx + a * src_cy);

            const float det = a * a + b * b;
            if (det > 1e-8f) {
                // Backward mapping through the inverse similarity
                const float inv_a = a / det;
                const float inv_b = b / det;

                Image aligned(ALIGNED_SIZE, ALIGNED_SIZE, 3);
                for (int y = 0; y < ALIGNED_SIZE; y++) {
                    for (int x = 0; x < ALIGNED_SIZE; x++) {
                        const float ux = x - tx;
                        const float uy = y - ty;
                        const float src_x = inv_a * ux + inv_b * uy;
                        const float src_y = -inv_b * ux + inv_a * uy;
                        sampleBilinear(image, src_x, src_y, aligned.data() + static_cast<size_t>(y) * aligned.stride() + x * 3);
                    }
                }
                return aligned;
            }
        }

        Logger::getInstance().debug("Degenerate landmarks, falling back to bbox alignment");
    }

    // No usable landmarks: crop the box and resize
    Rect r(static_cast<int>(face.x), static_cast<int>(face.y),
           std::max(1, static_cast<int>(face.width)), std::max(1, static_cast<int>(face.height)));
    r &= Rect(0, 0, image.width(), image.height());
    if (r.empty()) {
        return Image(ALIGNED_SIZE, ALIGNED_SIZE, 3);
    }
    Image crop = image.roi(r).clone();
    return resizeImage(crop.view(), ALIGNED_SIZE, ALIGNED_SIZE);
}

Embedding NcnnFaceModel::encodeFace(const Image& aligned) const {
    // ArcFace expects RGB normalized to [-1, 1]
    ncnn::Mat in = ncnn::Mat::from_pixels(aligned.data(), ncnn::Mat::PIXEL_BGR2RGB,
                                          aligned.width(), aligned.height(), aligned.stride());
    const float mean_vals[3] = {127.5f, 127.5f, 127.5f};
    const float norm_vals[3] = {1 / 127.5f, 1 / 127.5f, 1 / 127.5f};
    in.substract_mean_normalize(mean_vals, norm_vals);

    ncnn::Extractor ex = recognition_net_.create_extractor();
    ex.set_light_mode(true);
    ex.input("in0", in);

    ncnn::Mat out;
    int ret = ex.extract("out0", out);
    if (ret != 0) {
        throw FaceError(ErrorKind::Unexpected, "Recognition inference failed, ret=" + std::to_string(ret));
    }

    const size_t total = static_cast<size_t>(out.w) * out.h * out.c;
    if (total != encoding_dim_) {
        throw FaceError(ErrorKind::Unexpected, "Recognition model produced " + std::to_string(total) +
            " values, expected " + std::to_string(encoding_dim_));
    }

    ncnn::Mat flat = out.reshape(static_cast<int>(total));
    Embedding embedding(total);
    double norm = 0.0;
    for (size_t i = 0; i < total; i++) {
        embedding[i] = static_cast<double>(flat[i]);
        norm += embedding[i] * embedding[i];
    }
    norm = std::sqrt(norm);

    if (norm <= 0.0 || !std::isfinite(norm)) {
        throw FaceError(ErrorKind::DetectionFailure, "Face embedding has zero norm");
    }
    for (double& v : embedding) {
        v /= norm;
    }

    return embedding;
}

void NcnnFaceModel::estimateGenderAge(const ImageView& image, const FaceObject& face, FaceDetection& out) const {
    // Square crop 1.5x the longer box side around the box center
    const float cx = face.x + face.width / 2.f;
    const float cy = face.y + face.height / 2.f;
    const int side = std::max(1, static_cast<int>(std::max(face.width, face.height) * 1.5f));

    Image crop = centeredCrop(image, cx, cy, side);
    Image input = resizeImage(crop.view(), GENDERAGE_SIZE, GENDERAGE_SIZE);

    ncnn::Mat in = ncnn::Mat::from_pixels(input.data(), ncnn::Mat::PIXEL_BGR2RGB,
                                          input.width(), input.height(), input.stride());

    ncnn::Extractor ex = genderage_net_.create_extractor();
    ex.set_light_mode(true);
    ex.input("in0", in);

    ncnn::Mat pred;
    if (ex.extract("out0", pred) != 0 || pred.w * pred.h * pred.c < 3) {
        Logger::getInstance().warning("Gender/age inference failed; leaving estimates empty");
        return;
    }

    ncnn::Mat flat = pred.reshape(pred.w * pred.h * pred.c);
    // [female score, male score, age / 100]
    out.gender = flat[1] > flat[0] ? Gender::Male : Gender::Female;
    out.age = static_cast<int>(std::round(flat[2] * 100.f));
}

std::vector<FaceDetection> NcnnFaceModel::detect(const ImageView& image) const {
    if (!models_loaded_) {
        throw FaceError(ErrorKind::Unexpected, "Face models are not loaded");
    }
    if (image.empty() || image.channels() != 3) {
        throw FaceError(ErrorKind::InputValidation, "Face detection expects a 3-channel image");
    }

    std::vector<FaceObject> faces = detectFaces(image);
    Logger::getInstance().debug("Detector returned " + std::to_string(faces.size()) + " face(s)");

    std::vector<FaceDetection> detections;
    detections.reserve(faces.size());

    for (const FaceObject& face : faces) {
        FaceDetection d;
        d.bbox = Rect(static_cast<int>(face.x), static_cast<int>(face.y),
                      static_cast<int>(face.width), static_cast<int>(face.height));
        d.landmarks = face.landmarks;
        d.confidence = face.prob;

        Image aligned = alignFace(image, face);
        d.embedding = encodeFace(aligned);

        if (genderage_loaded_) {
            estimateGenderAge(image, face, d);
        }

        detections.push_back(std::move(d));
    }

    return detections;
}

} // namespace gymface
