#include "commands.h"
#include "cli_common.h"

namespace gymface {

using namespace gymface::cli;

namespace {

Json::Value faceJson(const FaceDetection& face) {
    Json::Value out;
    Json::Value box;
    box["x"] = face.bbox.x;
    box["y"] = face.bbox.y;
    box["width"] = face.bbox.width;
    box["height"] = face.bbox.height;
    out["bbox"] = box;
    out["confidence"] = face.confidence;

    Json::Value landmarks(Json::arrayValue);
    for (const Point& p : face.landmarks) {
        Json::Value point(Json::arrayValue);
        point.append(p.x);
        point.append(p.y);
        landmarks.append(point);
    }
    out["landmarks"] = landmarks;

    out["age"] = face.age ? Json::Value(*face.age) : Json::Value();
    out["gender"] = face.gender ? Json::Value(genderCode(*face.gender)) : Json::Value();
    out["embedding_dimensions"] = static_cast<Json::UInt64>(face.embedding.size());
    return out;
}

} // namespace

int cmd_detect(const std::string& config_path, const std::string& image_path) {
    auto settings = loadSettings(config_path);
    if (!settings) return 1;

    auto image = readImageBase64(image_path);
    if (!image) return 1;

    try {
        auto service = openService(*settings);
        DetectionResult result = service->detectAll(*image);

        Json::Value out = resultJson(result);
        if (result.success) {
            Json::Value faces(Json::arrayValue);
            for (const auto& face : result.faces) {
                faces.append(faceJson(face));
            }
            out["count"] = static_cast<Json::UInt64>(result.faces.size());
            out["faces"] = faces;
        }
        printJson(out);
        return result.success ? 0 : 1;
    } catch (const std::exception& e) {
        return printFailure(e);
    }
}

int cmd_quality(const std::string& config_path, const std::string& image_path) {
    auto settings = loadSettings(config_path);
    if (!settings) return 1;

    auto image = readImageBase64(image_path);
    if (!image) return 1;

    try {
        auto service = openService(*settings);
        QualityAssessmentResult result = service->assessQuality(*image);

        Json::Value out = resultJson(result);
        if (result.success) {
            out["score"] = result.report.score;
            out["face_ratio"] = result.report.face_ratio;
            out["brightness"] = result.report.brightness;
            out["sharpness"] = result.report.sharpness;
            Json::Value issues(Json::arrayValue);
            for (const auto& issue : result.report.issues) {
                issues.append(issue);
            }
            out["issues"] = issues;
        }
        printJson(out);
        return result.success ? 0 : 1;
    } catch (const std::exception& e) {
        return printFailure(e);
    }
}

} // namespace gymface
