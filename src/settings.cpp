#include "settings.h"
#include "config.h"
#include "config_paths.h"
#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace gymface {

std::vector<std::string> parseFormatList(const std::string& text) {
    std::vector<std::string> formats;
    std::stringstream ss(text);
    std::string token;

    while (std::getline(ss, token, ',')) {
        size_t first = token.find_first_not_of(" \t");
        if (first == std::string::npos) continue;
        size_t last = token.find_last_not_of(" \t");
        token = token.substr(first, last - first + 1);
        std::transform(token.begin(), token.end(), token.begin(), ::tolower);
        formats.push_back(token);
    }

    return formats;
}

Settings Settings::fromConfig(const Config& config) {
    Settings s;
    s.recognition.models_dir = MODELS_DIR;
    s.storage.database_path = std::string(DATA_DIR) + "/biometrics.db";

    // [anti_spoofing]
    if (auto v = config.getBool("anti_spoofing", "enabled")) s.anti_spoofing.enabled = *v;
    if (auto v = config.getDouble("anti_spoofing", "min_liveness_score")) s.anti_spoofing.min_liveness_score = *v;

    // [recognition]
    if (auto v = config.getDouble("recognition", "tolerance")) s.recognition.tolerance = *v;
    if (auto v = config.getInt("recognition", "embedding_dimensions")) {
        if (*v > 0) s.recognition.embedding_dimensions = static_cast<size_t>(*v);
    }
    if (auto v = config.getInt("recognition", "detection_size")) s.recognition.detection_size = *v;
    if (auto v = config.getDouble("recognition", "detection_confidence")) s.recognition.detection_confidence = *v;
    if (auto v = config.getString("recognition", "models_dir")) s.recognition.models_dir = *v;
    if (auto v = config.getString("recognition", "detection_model")) s.recognition.detection_model = *v;
    if (auto v = config.getString("recognition", "recognition_model")) s.recognition.recognition_model = *v;
    if (auto v = config.getString("recognition", "genderage_model")) s.recognition.genderage_model = *v;

    // [validation]
    if (auto v = config.getInt("validation", "min_age")) s.validation.min_age = *v;
    if (auto v = config.getInt("validation", "max_age")) s.validation.max_age = *v;
    if (auto v = config.getDouble("validation", "min_face_size_ratio")) s.validation.min_face_size_ratio = *v;
    if (auto v = config.getDouble("validation", "max_face_angle")) s.validation.max_face_angle = *v;

    // [image] / [thumbnail]
    if (auto v = config.getDouble("image", "max_size_mb")) s.image.max_size_mb = *v;
    if (auto v = config.getString("image", "allowed_formats")) {
        auto formats = parseFormatList(*v);
        if (!formats.empty()) s.image.allowed_formats = formats;
    }
    if (auto v = config.getInt("image", "max_pixels")) s.image.max_pixels = *v;
    if (auto v = config.getInt("thumbnail", "width")) s.image.thumbnail_width = *v;
    if (auto v = config.getInt("thumbnail", "height")) s.image.thumbnail_height = *v;
    if (auto v = config.getInt("thumbnail", "quality")) s.image.thumbnail_quality = *v;

    // [storage]
    if (auto v = config.getString("storage", "database_path")) s.storage.database_path = *v;
    if (auto v = config.getString("storage", "encryption_key")) s.storage.encryption_key = *v;

    const char* env_key = std::getenv("GYMFACE_ENCRYPTION_KEY");
    if (env_key != nullptr && env_key[0] != '\0') {
        s.storage.encryption_key = env_key;
    }

    // [logging]
    if (auto v = config.getString("logging", "level")) s.log_level = *v;

    return s;
}

} // namespace gymface
