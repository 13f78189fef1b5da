#ifndef GYMFACE_BIOMETRIC_STORE_H
#define GYMFACE_BIOMETRIC_STORE_H

#include "crypto_utils.h"
#include "face_model.h"
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

namespace gymface {

enum class BiometricType {
    FACE,
    FINGERPRINT
};

inline const char* biometricTypeName(BiometricType type) {
    return type == BiometricType::FINGERPRINT ? "FINGERPRINT" : "FACE";
}

struct BiometricRecord {
    std::string id;
    std::string subject_id;
    BiometricType type = BiometricType::FACE;
    Embedding embedding;
    Bytes thumbnail;          // AES-256-GCM sealed JPEG
    bool is_active = false;
    std::string created_at;   // UTC ISO-8601
    std::string updated_at;
    Json::Value metadata;
};

struct SimilarityMatch {
    BiometricRecord record;
    double distance = 0.0;    // cosine distance, 1 - similarity
    double similarity = 0.0;
};

// Persistence of face biometrics. At most one active FACE record exists per subject.
class BiometricStore {
public:
    virtual ~BiometricStore() = default;

    // Deactivates the subject's active FACE records and inserts a new active one.
    // Returns the new record id. FaceError(InputValidation) on a dimension mismatch.
    virtual std::string store(const std::string& subject_id, const Embedding& embedding,
                              const Bytes& thumbnail_jpeg, const std::string& model_name) = 0;

    // Active FACE records with cosine distance <= threshold, nearest first, at most `limit`
    virtual std::vector<SimilarityMatch> searchSimilar(const Embedding& embedding, size_t limit,
                                                       double distance_threshold,
                                                       const std::optional<std::string>& exclude_subject = std::nullopt) = 0;

    // Soft delete; returns how many records were deactivated, FaceError(NotFound) when none
    virtual size_t deactivate(const std::string& subject_id) = 0;

    virtual std::optional<BiometricRecord> activeRecord(const std::string& subject_id) = 0;
    virtual std::vector<BiometricRecord> listActive() = 0;

    // Every FACE record of the subject, newest first, active or not
    virtual std::vector<BiometricRecord> history(const std::string& subject_id) = 0;

    virtual Bytes decryptThumbnail(const BiometricRecord& record) const = 0;
};

} // namespace gymface

#endif // GYMFACE_BIOMETRIC_STORE_H
