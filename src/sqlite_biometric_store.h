#ifndef GYMFACE_SQLITE_BIOMETRIC_STORE_H
#define GYMFACE_SQLITE_BIOMETRIC_STORE_H

#include "biometric_store.h"
#include "sqlite_db.h"
#include "thumbnail_cipher.h"
#include <memory>

namespace gymface {

// BiometricStore on SQLite.
//
// Embeddings are BLOBs of native doubles. Similarity search runs in SQL through
// the cosine_distance(a, b) function registered on the connection.
// The deactivate-then-insert of store() runs in one BEGIN IMMEDIATE transaction,
// and a unique partial index on (subject_id, type) WHERE is_active = 1 rejects
// any second active record that slips past it.
class SqliteBiometricStore : public BiometricStore {
public:
    SqliteBiometricStore(const std::string& db_path, size_t embedding_dimensions,
                         ThumbnailCipher cipher, int thumbnail_quality);

    std::string store(const std::string& subject_id, const Embedding& embedding,
                      const Bytes& thumbnail_jpeg, const std::string& model_name) override;

    std::vector<SimilarityMatch> searchSimilar(const Embedding& embedding, size_t limit,
                                               double distance_threshold,
                                               const std::optional<std::string>& exclude_subject = std::nullopt) override;

    size_t deactivate(const std::string& subject_id) override;

    std::optional<BiometricRecord> activeRecord(const std::string& subject_id) override;
    std::vector<BiometricRecord> listActive() override;
    std::vector<BiometricRecord> history(const std::string& subject_id) override;

    Bytes decryptThumbnail(const BiometricRecord& record) const override;

    // sqlite callback: cosine_distance(blob, blob) -> real
    static void cosineDistanceFunction(sqlite3_context* ctx, int argc, sqlite3_value** argv);

private:
    std::unique_ptr<SqliteDatabase> db_;
    size_t embedding_dimensions_;
    ThumbnailCipher cipher_;
    int thumbnail_quality_;

    void createSchema();
    void registerFunctions();
    void checkDimensions(const Embedding& embedding) const;
    std::vector<BiometricRecord> queryRecords(const std::string& where, const std::string& subject_id);
};

} // namespace gymface

#endif // GYMFACE_SQLITE_BIOMETRIC_STORE_H
