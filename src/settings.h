#ifndef GYMFACE_SETTINGS_H
#define GYMFACE_SETTINGS_H

#include "encoding_config.h"
#include <string>
#include <vector>

namespace gymface {

class Config;

struct AntiSpoofingSettings {
    bool enabled = true;
    double min_liveness_score = 0.5;
};

struct RecognitionSettings {
    double tolerance = 0.6;
    size_t embedding_dimensions = FACE_ENCODING_DIM;
    int detection_size = 640;
    double detection_confidence = 0.5;
    std::string models_dir;
    std::string detection_model;    // base path without extension; empty = auto
    std::string recognition_model;  // base path without extension; empty = auto
    std::string genderage_model;    // base path without extension; empty = disabled
};

struct ValidationSettings {
    int min_age = 5;
    int max_age = 100;
    double min_face_size_ratio = 0.02;
    double max_face_angle = 45.0;
};

struct ImageSettings {
    double max_size_mb = 5.0;
    std::vector<std::string> allowed_formats = {"jpg", "jpeg", "png", "webp"};
    // Decoded width x height ceiling, checked from the header before decoding
    long long max_pixels = 89478485;
    int thumbnail_width = 150;
    int thumbnail_height = 150;
    int thumbnail_quality = 70;
};

struct StorageSettings {
    std::string database_path;
    std::string encryption_key;
};

// Typed view of the configuration, passed explicitly to every component
struct Settings {
    AntiSpoofingSettings anti_spoofing;
    RecognitionSettings recognition;
    ValidationSettings validation;
    ImageSettings image;
    StorageSettings storage;
    std::string log_level = "info";

    // Missing keys keep their defaults; GYMFACE_ENCRYPTION_KEY overrides [storage] encryption_key
    static Settings fromConfig(const Config& config);
};

// Split "jpg, PNG ,webp" into lower-case trimmed tokens
std::vector<std::string> parseFormatList(const std::string& text);

} // namespace gymface

#endif // GYMFACE_SETTINGS_H
