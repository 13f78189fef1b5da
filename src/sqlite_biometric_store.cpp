#include "sqlite_biometric_store.h"
#include "encoding_config.h"
#include "errors.h"
#include "logger.h"
#include <cmath>
#include <cstring>
#include <memory>
#include <sstream>

namespace gymface {

namespace {

Bytes serializeEmbedding(const Embedding& embedding) {
    Bytes blob(embedding.size() * sizeof(double));
    std::memcpy(blob.data(), embedding.data(), blob.size());
    return blob;
}

Embedding deserializeEmbedding(const void* data, size_t size) {
    Embedding embedding(size / sizeof(double));
    if (!embedding.empty()) {
        std::memcpy(embedding.data(), data, embedding.size() * sizeof(double));
    }
    return embedding;
}

std::string toJsonString(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Json::Value parseJson(const std::string& text) {
    Json::Value root;
    if (text.empty()) {
        return root;
    }
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        Logger::getInstance().warning("Unreadable record metadata: " + errors);
        return Json::Value();
    }
    return root;
}

constexpr const char* RECORD_COLUMNS =
    "id, subject_id, type, embedding, thumbnail, is_active, created_at, updated_at, metadata";

// Column order matches RECORD_COLUMNS
BiometricRecord readRecord(const SqliteStatement& stmt) {
    BiometricRecord record;
    record.id = stmt.columnText(0);
    record.subject_id = stmt.columnText(1);
    record.type = stmt.columnText(2) == "FINGERPRINT" ? BiometricType::FINGERPRINT : BiometricType::FACE;
    Bytes blob = stmt.columnBlob(3);
    record.embedding = deserializeEmbedding(blob.data(), blob.size());
    record.thumbnail = stmt.columnBlob(4);
    record.is_active = stmt.columnInt(5) != 0;
    record.created_at = stmt.columnText(6);
    record.updated_at = stmt.columnText(7);
    record.metadata = parseJson(stmt.columnText(8));
    return record;
}

} // namespace

SqliteBiometricStore::SqliteBiometricStore(const std::string& db_path, size_t embedding_dimensions,
                                           ThumbnailCipher cipher, int thumbnail_quality)
    : db_(std::make_unique<SqliteDatabase>(db_path)),
      embedding_dimensions_(embedding_dimensions),
      cipher_(std::move(cipher)),
      thumbnail_quality_(thumbnail_quality) {
    registerFunctions();
    createSchema();
    Logger::getInstance().info("Biometric store ready: " + db_path + " (" +
        std::to_string(embedding_dimensions_) + "D embeddings)");
}

void SqliteBiometricStore::createSchema() {
    db_->exec(R"(
        CREATE TABLE IF NOT EXISTS biometrics (
            id TEXT PRIMARY KEY,
            subject_id TEXT NOT NULL,
            type TEXT NOT NULL,
            embedding BLOB NOT NULL,
            thumbnail BLOB NOT NULL,
            is_active INTEGER NOT NULL DEFAULT 1,
            created_at TEXT NOT NULL,
            updated_at TEXT NOT NULL,
            metadata TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_biometrics_subject ON biometrics(subject_id, type);
        CREATE UNIQUE INDEX IF NOT EXISTS idx_biometrics_one_active
            ON biometrics(subject_id, type) WHERE is_active = 1;
    )");
}

void SqliteBiometricStore::cosineDistanceFunction(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
    if (argc != 2 ||
        sqlite3_value_type(argv[0]) != SQLITE_BLOB ||
        sqlite3_value_type(argv[1]) != SQLITE_BLOB) {
        sqlite3_result_null(ctx);
        return;
    }

    const int size_a = sqlite3_value_bytes(argv[0]);
    const int size_b = sqlite3_value_bytes(argv[1]);
    if (size_a != size_b || size_a == 0 || size_a % sizeof(double) != 0) {
        sqlite3_result_error(ctx, "cosine_distance: vectors differ in length", -1);
        return;
    }

    Embedding a = deserializeEmbedding(sqlite3_value_blob(argv[0]), size_a);
    Embedding b = deserializeEmbedding(sqlite3_value_blob(argv[1]), size_b);

    double dot = 0.0, norm_a = 0.0, norm_b = 0.0;
    for (size_t i = 0; i < a.size(); i++) {
        dot += a[i] * b[i];
        norm_a += a[i] * a[i];
        norm_b += b[i] * b[i];
    }

    if (norm_a == 0.0 || norm_b == 0.0) {
        sqlite3_result_double(ctx, 1.0);
        return;
    }
    sqlite3_result_double(ctx, 1.0 - dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

void SqliteBiometricStore::registerFunctions() {
    int rc = sqlite3_create_function_v2(db_->handle(), "cosine_distance", 2,
                                        SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr,
                                        &SqliteBiometricStore::cosineDistanceFunction,
                                        nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        db_->fail("create_function cosine_distance");
    }
}

void SqliteBiometricStore::checkDimensions(const Embedding& embedding) const {
    if (embedding.size() != embedding_dimensions_) {
        std::string msg = "Invalid embedding dimensions: expected " + std::to_string(embedding_dimensions_) +
            ", got " + std::to_string(embedding.size());
        Logger::getInstance().error(msg);
        throw FaceError(ErrorKind::InputValidation, msg);
    }
}

std::string SqliteBiometricStore::store(const std::string& subject_id, const Embedding& embedding,
                                        const Bytes& thumbnail_jpeg, const std::string& model_name) {
    Logger::getInstance().info("Storing face biometric for subject " + subject_id);
    checkDimensions(embedding);

    Bytes sealed = cipher_.encrypt(thumbnail_jpeg);
    Bytes blob = serializeEmbedding(embedding);

    Json::Value metadata;
    metadata["encoding_version"] = FACE_ENCODING_VERSION;
    metadata["model"] = model_name;
    metadata["embedding_dimensions"] = static_cast<Json::UInt64>(embedding_dimensions_);
    metadata["encryption"] = THUMBNAIL_ENCRYPTION_SCHEME;
    metadata["thumbnail_quality"] = thumbnail_quality_;

    const std::string record_id = generateUuid();
    const std::string now = utcTimestamp();

    std::lock_guard<std::mutex> lock(db_->mutex());
    SqliteTransaction txn(*db_);

    SqliteStatement deactivate_stmt = db_->prepare(
        "UPDATE biometrics SET is_active = 0, updated_at = ?1 "
        "WHERE subject_id = ?2 AND type = 'FACE' AND is_active = 1");
    deactivate_stmt.bindText(1, now);
    deactivate_stmt.bindText(2, subject_id);
    deactivate_stmt.step();
    const int deactivated = db_->changes();

    SqliteStatement insert = db_->prepare(
        "INSERT INTO biometrics (id, subject_id, type, embedding, thumbnail, is_active, created_at, updated_at, metadata) "
        "VALUES (?1, ?2, 'FACE', ?3, ?4, 1, ?5, ?5, ?6)");
    insert.bindText(1, record_id);
    insert.bindText(2, subject_id);
    insert.bindBlob(3, blob.data(), blob.size());
    insert.bindBlob(4, sealed.data(), sealed.size());
    insert.bindText(5, now);
    insert.bindText(6, toJsonString(metadata));
    insert.step();

    txn.commit();

    if (deactivated > 0) {
        Logger::getInstance().debug("Deactivated " + std::to_string(deactivated) +
            " existing face biometric(s) for subject " + subject_id);
    }
    Logger::getInstance().info("Stored face biometric " + record_id + " for subject " + subject_id);
    return record_id;
}

std::vector<SimilarityMatch> SqliteBiometricStore::searchSimilar(const Embedding& embedding, size_t limit,
                                                                 double distance_threshold,
                                                                 const std::optional<std::string>& exclude_subject) {
    checkDimensions(embedding);
    Bytes blob = serializeEmbedding(embedding);

    std::ostringstream sql;
    sql << "SELECT " << RECORD_COLUMNS << ", distance FROM ("
        << "SELECT " << RECORD_COLUMNS << ", cosine_distance(embedding, ?1) AS distance "
        << "FROM biometrics WHERE type = 'FACE' AND is_active = 1"
        << (exclude_subject ? " AND subject_id != ?4" : "")
        << ") WHERE distance <= ?2 ORDER BY distance ASC LIMIT ?3";

    std::lock_guard<std::mutex> lock(db_->mutex());
    SqliteStatement stmt = db_->prepare(sql.str());
    stmt.bindBlob(1, blob.data(), blob.size());
    stmt.bindDouble(2, distance_threshold);
    stmt.bindInt(3, static_cast<int>(limit));
    if (exclude_subject) {
        stmt.bindText(4, *exclude_subject);
    }

    std::vector<SimilarityMatch> matches;
    while (stmt.step()) {
        SimilarityMatch match;
        match.record = readRecord(stmt);
        match.distance = stmt.columnDouble(9);
        match.similarity = 1.0 - match.distance;
        matches.push_back(std::move(match));
    }

    Logger::getInstance().debug("Found " + std::to_string(matches.size()) + " similar face match(es) within distance " +
        std::to_string(distance_threshold));
    return matches;
}

size_t SqliteBiometricStore::deactivate(const std::string& subject_id) {
    std::lock_guard<std::mutex> lock(db_->mutex());

    SqliteStatement stmt = db_->prepare(
        "UPDATE biometrics SET is_active = 0, updated_at = ?1 "
        "WHERE subject_id = ?2 AND type = 'FACE' AND is_active = 1");
    stmt.bindText(1, utcTimestamp());
    stmt.bindText(2, subject_id);
    stmt.step();

    const int count = db_->changes();
    if (count == 0) {
        throw FaceError(ErrorKind::NotFound, "No active face biometric found");
    }

    Logger::getInstance().info("Deactivated " + std::to_string(count) + " face biometric(s) for subject " + subject_id);
    return static_cast<size_t>(count);
}

std::vector<BiometricRecord> SqliteBiometricStore::queryRecords(const std::string& where, const std::string& subject_id) {
    std::lock_guard<std::mutex> lock(db_->mutex());

    SqliteStatement stmt = db_->prepare(std::string("SELECT ") + RECORD_COLUMNS +
        " FROM biometrics WHERE type = 'FACE'" + where + " ORDER BY created_at DESC, rowid DESC");
    if (!subject_id.empty()) {
        stmt.bindText(1, subject_id);
    }

    std::vector<BiometricRecord> records;
    while (stmt.step()) {
        records.push_back(readRecord(stmt));
    }
    return records;
}

std::optional<BiometricRecord> SqliteBiometricStore::activeRecord(const std::string& subject_id) {
    std::vector<BiometricRecord> records = queryRecords(" AND is_active = 1 AND subject_id = ?1", subject_id);
    if (records.empty()) {
        return std::nullopt;
    }
    return std::move(records.front());
}

std::vector<BiometricRecord> SqliteBiometricStore::listActive() {
    return queryRecords(" AND is_active = 1", "");
}

std::vector<BiometricRecord> SqliteBiometricStore::history(const std::string& subject_id) {
    return queryRecords(" AND subject_id = ?1", subject_id);
}

Bytes SqliteBiometricStore::decryptThumbnail(const BiometricRecord& record) const {
    return cipher_.decrypt(record.thumbnail);
}

} // namespace gymface
