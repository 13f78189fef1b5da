#ifndef GYMFACE_CLI_COMMON_H
#define GYMFACE_CLI_COMMON_H

/**
 * CLI Common Utilities and Includes
 *
 * Provides shared headers and utilities for CLI commands
 */

// ========== Standard Library Includes ==========
#include <iostream>
#include <string>
#include <vector>
#include <fstream>
#include <sstream>
#include <iterator>
#include <memory>
#include <optional>

// ========== Third-Party Includes ==========
#include <json/json.h>

// ========== gymface Library Includes ==========
#include "../config.h"
#include "../crypto_utils.h"
#include "../errors.h"
#include "../face_recognition_service.h"
#include "../logger.h"
#include "../ncnn_face_model.h"
#include "../settings.h"
#include "../sqlite_biometric_store.h"
#include "../sqlite_subject_directory.h"
#include "../thumbnail_cipher.h"
#include "config_paths.h"

namespace gymface {
namespace cli {

/**
 * Default configuration file: CONFIG_DIR/gymface.conf
 */
inline std::string defaultConfigPath() {
    return std::string(CONFIG_DIR) + "/gymface.conf";
}

/**
 * Load settings from an INI file.
 *
 * A missing default file falls back to built-in defaults; a missing file that
 * was named explicitly with --config is an error. Validation errors are fatal.
 * Also applies [logging] level to the logger.
 *
 * @param config_path Path given with --config (empty for the default)
 * @return Settings, or nullopt after printing the reason to stderr
 */
inline std::optional<Settings> loadSettings(const std::string& config_path) {
    Config config;
    const bool explicit_path = !config_path.empty();
    const std::string path = explicit_path ? config_path : defaultConfigPath();

    if (!config.load(path)) {
        std::vector<std::string> errors = config.getValidationErrors();
        if (explicit_path || errors.empty() || errors.front().rfind("Cannot open", 0) != 0) {
            for (const auto& e : errors) {
                std::cerr << "Config error: " << e << std::endl;
            }
            return std::nullopt;
        }
        Logger::getInstance().debug("No config at " + path + ", using defaults");
    }

    Settings settings = Settings::fromConfig(config);
    Logger::getInstance().setLogLevel(parseLogLevel(settings.log_level));
    return settings;
}

/**
 * Read an image file and base64-encode it, so CLI input takes the same
 * ingestion path as network payloads.
 *
 * @return base64 text, or nullopt if the file cannot be read
 */
inline std::optional<std::string> readImageBase64(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        std::cerr << "Error: cannot open image file: " << path << std::endl;
        return std::nullopt;
    }
    Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return base64Encode(data);
}

/**
 * Open the biometric store configured in [storage]; requires an encryption key.
 */
inline std::shared_ptr<SqliteBiometricStore> openStore(const Settings& settings) {
    if (settings.storage.encryption_key.empty()) {
        throw FaceError(ErrorKind::InputValidation,
            "No encryption key configured. Set [storage] encryption_key or GYMFACE_ENCRYPTION_KEY");
    }
    return std::make_shared<SqliteBiometricStore>(settings.storage.database_path,
                                                  settings.recognition.embedding_dimensions,
                                                  ThumbnailCipher(settings.storage.encryption_key),
                                                  settings.image.thumbnail_quality);
}

inline std::shared_ptr<SqliteSubjectDirectory> openSubjects(const Settings& settings) {
    return std::make_shared<SqliteSubjectDirectory>(settings.storage.database_path);
}

/**
 * Load the ncnn models and wire up the recognition service
 */
inline std::unique_ptr<FaceRecognitionService> openService(const Settings& settings) {
    auto model = std::make_shared<NcnnFaceModel>(settings.recognition);
    model->loadModels();
    return std::make_unique<FaceRecognitionService>(settings, model, openStore(settings), openSubjects(settings));
}

/**
 * Print a JSON document to stdout (indented)
 */
inline void printJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    std::cout << Json::writeString(builder, value) << std::endl;
}

/**
 * Start a JSON result object from the common result fields
 */
inline Json::Value resultJson(const OperationResult& result) {
    Json::Value out;
    out["success"] = result.success;
    if (!result.success) {
        out["error"] = result.error;
        out["error_kind"] = errorKindName(result.error_kind);
    }
    return out;
}

/**
 * Print a failure raised before a service call
 */
inline int printFailure(const std::exception& e) {
    Json::Value out;
    out["success"] = false;
    out["error"] = e.what();
    if (const auto* fe = dynamic_cast<const FaceError*>(&e)) {
        out["error_kind"] = errorKindName(fe->kind());
    } else {
        out["error_kind"] = errorKindName(ErrorKind::Unexpected);
    }
    printJson(out);
    return 1;
}

/**
 * Parse a tolerance argument
 */
inline std::optional<double> parseTolerance(const std::string& text) {
    try {
        size_t consumed = 0;
        double value = std::stod(text, &consumed);
        if (consumed == text.size()) {
            return value;
        }
    } catch (const std::logic_error&) {
        // reported below
    }
    std::cerr << "Error: invalid tolerance: " << text << std::endl;
    return std::nullopt;
}

} // namespace cli
} // namespace gymface

#endif // GYMFACE_CLI_COMMON_H
