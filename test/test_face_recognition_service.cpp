/**
 * @file test_face_recognition_service.cpp
 * @brief Workflow tests for FaceRecognitionService
 *
 * Validates:
 * - register / update keep exactly one active record per subject
 * - authenticate by similarity search, subject lookup and tolerance
 * - delete as a soft delete
 * - compare_two scoring
 * - rejection categories (input, detection, quality, spoof, not found, unexpected)
 */

#include <gtest/gtest.h>
#include "face_recognition_service.h"
#include "sqlite_biometric_store.h"
#include "sqlite_subject_directory.h"
#include "test_support.h"

using namespace gymface;
using namespace gymface::testing;

class FaceRecognitionServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_.recognition.embedding_dimensions = TEST_DIMS;
        settings_.recognition.tolerance = 0.6;
        model_ = std::make_shared<StubFaceModel>();
        store_ = std::make_shared<SqliteBiometricStore>(":memory:", TEST_DIMS, ThumbnailCipher("test-secret"), 70);
        subjects_ = std::make_shared<SqliteSubjectDirectory>(":memory:");
        subjects_->upsert("member-1", "Member member-1");
        rebuild();
    }

    void rebuild() {
        service_ = std::make_unique<FaceRecognitionService>(settings_, model_, store_, subjects_);
    }

    void registerMember(const std::string& id, const Embedding& embedding) {
        subjects_->upsert(id, "Member " + id);
        model_->enqueueFace(embedding);
        RegistrationResult r = service_->registerFace(id, noiseImageBase64());
        ASSERT_TRUE(r.success) << r.error;
    }

    Settings settings_;
    std::shared_ptr<StubFaceModel> model_;
    std::shared_ptr<SqliteBiometricStore> store_;
    std::shared_ptr<SqliteSubjectDirectory> subjects_;
    std::unique_ptr<FaceRecognitionService> service_;
};

// ===== register / update =====

TEST_F(FaceRecognitionServiceTest, RegisterCreatesActiveRecord) {
    model_->enqueueFace(axisEmbedding(0));

    RegistrationResult result = service_->registerFace("member-1", noiseImageBase64());

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.error_kind, ErrorKind::None);
    EXPECT_EQ(result.subject_id, "member-1");
    EXPECT_FALSE(result.record_id.empty());

    auto record = store_->activeRecord("member-1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->id, result.record_id);
    EXPECT_TRUE(record->is_active);
    EXPECT_EQ(record->embedding, axisEmbedding(0));
    EXPECT_EQ(record->metadata["model"].asString(), "stub-face-model");
}

TEST_F(FaceRecognitionServiceTest, ThumbnailIsEncryptedJpeg) {
    model_->enqueueFace(axisEmbedding(0));
    ASSERT_TRUE(service_->registerFace("member-1", noiseImageBase64()).success);

    auto record = store_->activeRecord("member-1");
    ASSERT_TRUE(record.has_value());
    ASSERT_GT(record->thumbnail.size(), ThumbnailCipher::NONCE_SIZE + ThumbnailCipher::TAG_SIZE);

    Bytes jpeg = store_->decryptThumbnail(*record);
    ASSERT_GE(jpeg.size(), 3u);
    EXPECT_EQ(jpeg[0], 0xFF);
    EXPECT_EQ(jpeg[1], 0xD8);
    EXPECT_NE(record->thumbnail, jpeg);
}

TEST_F(FaceRecognitionServiceTest, SecondRegistrationReplacesFirst) {
    model_->enqueueFace(axisEmbedding(0));
    RegistrationResult first = service_->registerFace("member-1", noiseImageBase64(1));
    ASSERT_TRUE(first.success) << first.error;

    model_->enqueueFace(axisEmbedding(1));
    RegistrationResult second = service_->registerFace("member-1", noiseImageBase64(2));
    ASSERT_TRUE(second.success) << second.error;

    auto history = store_->history("member-1");
    ASSERT_EQ(history.size(), 2u);
    int active = 0;
    for (const auto& record : history) {
        if (record.is_active) {
            active++;
            EXPECT_EQ(record.id, second.record_id);
        } else {
            EXPECT_EQ(record.id, first.record_id);
        }
    }
    EXPECT_EQ(active, 1);
}

TEST_F(FaceRecognitionServiceTest, UpdateReplacesActiveEmbedding) {
    registerMember("member-1", axisEmbedding(0));

    model_->enqueueFace(axisEmbedding(3));
    RegistrationResult updated = service_->updateFace("member-1", noiseImageBase64(5));
    ASSERT_TRUE(updated.success) << updated.error;

    auto record = store_->activeRecord("member-1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->id, updated.record_id);
    EXPECT_EQ(record->embedding, axisEmbedding(3));
    EXPECT_EQ(store_->listActive().size(), 1u);
}

TEST_F(FaceRecognitionServiceTest, RegisterRejectsEmptySubject) {
    model_->enqueueFace(axisEmbedding(0));

    RegistrationResult result = service_->registerFace("", noiseImageBase64());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::InputValidation);
    EXPECT_TRUE(store_->listActive().empty());
}

TEST_F(FaceRecognitionServiceTest, RegisterRejectsUnknownSubject) {
    RegistrationResult result = service_->registerFace("member-404", noiseImageBase64());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::NotFound);
    EXPECT_EQ(result.error, ERROR_SUBJECT_NOT_FOUND);
    EXPECT_TRUE(store_->history("member-404").empty());
    EXPECT_EQ(model_->calls(), 0);
}

TEST_F(FaceRecognitionServiceTest, RegisterRejectsInactiveSubject) {
    subjects_->setActive("member-1", false);

    RegistrationResult result = service_->registerFace("member-1", noiseImageBase64());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::InputValidation);
    EXPECT_EQ(result.error, ERROR_SUBJECT_INACTIVE);
    EXPECT_FALSE(store_->activeRecord("member-1").has_value());
}

TEST_F(FaceRecognitionServiceTest, UpdateRejectsInactiveSubject) {
    registerMember("member-1", axisEmbedding(0));
    subjects_->setActive("member-1", false);

    model_->enqueueFace(axisEmbedding(3));
    RegistrationResult result = service_->updateFace("member-1", noiseImageBase64(5));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ERROR_SUBJECT_INACTIVE);
    auto record = store_->activeRecord("member-1");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->embedding, axisEmbedding(0));
}

TEST_F(FaceRecognitionServiceTest, RegisterRejectsInvalidBase64) {
    RegistrationResult result = service_->registerFace("member-1", "%%% not base64 %%%");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::InputValidation);
    EXPECT_EQ(result.error, "Invalid base64 image data");
    EXPECT_EQ(model_->calls(), 0);
}

TEST_F(FaceRecognitionServiceTest, RegisterRejectsOversizedImage) {
    settings_.image.max_size_mb = 0.01;
    rebuild();
    model_->enqueueFace(axisEmbedding(0));

    RegistrationResult result = service_->registerFace("member-1", noiseImageBase64());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::InputValidation);
    EXPECT_NE(result.error.find("exceeds maximum allowed size"), std::string::npos) << result.error;
    EXPECT_FALSE(store_->activeRecord("member-1").has_value());
}

TEST_F(FaceRecognitionServiceTest, RegisterRejectsPhotoAttack) {
    model_->enqueueFace(axisEmbedding(0));

    RegistrationResult result = service_->registerFace("member-1", flatImageBase64());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::SpoofRejection);
    EXPECT_EQ(result.error, "Photo attack detected. Please use a live camera capture");
    EXPECT_EQ(model_->calls(), 0);
    EXPECT_FALSE(store_->activeRecord("member-1").has_value());
}

TEST_F(FaceRecognitionServiceTest, RegisterSkipsLivenessWhenDisabled) {
    settings_.anti_spoofing.enabled = false;
    rebuild();
    model_->enqueueFace(axisEmbedding(0));

    RegistrationResult result = service_->registerFace("member-1", flatImageBase64());

    EXPECT_TRUE(result.success) << result.error;
}

TEST_F(FaceRecognitionServiceTest, RegisterRejectsNoFace) {
    model_->enqueue({});

    RegistrationResult result = service_->registerFace("member-1", noiseImageBase64());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::DetectionFailure);
    EXPECT_EQ(result.error, ERROR_NO_FACE_DETECTED);
}

TEST_F(FaceRecognitionServiceTest, RegisterRejectsMultipleFaces) {
    model_->enqueue({frontalFace(axisEmbedding(0)), frontalFace(axisEmbedding(1))});

    RegistrationResult result = service_->registerFace("member-1", noiseImageBase64());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::DetectionFailure);
    EXPECT_EQ(result.error, ERROR_MULTIPLE_FACES);
    EXPECT_TRUE(store_->listActive().empty());
}

TEST_F(FaceRecognitionServiceTest, RegisterRejectsSmallFace) {
    FaceDetection face = frontalFace(axisEmbedding(0));
    face.bbox = Rect(150, 100, 12, 12);
    model_->enqueue({face});

    RegistrationResult result = service_->registerFace("member-1", noiseImageBase64());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::QualityRejection);
    EXPECT_EQ(result.error, ERROR_FACE_TOO_SMALL);
    EXPECT_FALSE(store_->activeRecord("member-1").has_value());
}

TEST_F(FaceRecognitionServiceTest, RegisterRejectsImplausibleAge) {
    FaceDetection face = frontalFace(axisEmbedding(0));
    face.age = 140;
    model_->enqueue({face});

    RegistrationResult result = service_->registerFace("member-1", noiseImageBase64());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::QualityRejection);
    EXPECT_NE(result.error.find("Estimated age out of range (140 years)"), std::string::npos);
}

TEST_F(FaceRecognitionServiceTest, RegisterRejectsWrongEmbeddingLength) {
    model_->enqueueFace(Embedding(128, 0.05));

    RegistrationResult result = service_->registerFace("member-1", noiseImageBase64());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::InputValidation);
    EXPECT_EQ(result.error, "Expected 512-dimensional embedding, got 128 dimensions");
}

TEST_F(FaceRecognitionServiceTest, ModelFailureIsReportedAsUnexpected) {
    model_->failNextWith("inference crashed");

    RegistrationResult result = service_->registerFace("member-1", noiseImageBase64());

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::Unexpected);
    EXPECT_EQ(result.error, "Registration failed: inference crashed");
}

// ===== authenticate =====

TEST_F(FaceRecognitionServiceTest, AuthenticateFindsRegisteredMember) {
    registerMember("member-1", axisEmbedding(0));
    registerMember("member-2", axisEmbedding(1));

    model_->enqueueFace(embeddingWithSimilarity(0, 2, 0.95));
    AuthenticationResult result = service_->authenticate(noiseImageBase64(9));

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.subject_id, "member-1");
    ASSERT_TRUE(result.subject.has_value());
    EXPECT_EQ(result.subject->display_name, "Member member-1");
    EXPECT_NEAR(result.similarity, 0.95, 1e-9);
    EXPECT_NEAR(result.distance, 0.05, 1e-9);
}

TEST_F(FaceRecognitionServiceTest, AuthenticateRejectsUnknownFace) {
    registerMember("member-1", axisEmbedding(0));

    model_->enqueueFace(embeddingWithSimilarity(0, 2, 0.2));
    AuthenticationResult result = service_->authenticate(noiseImageBase64(9));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::NotFound);
    EXPECT_EQ(result.error, ERROR_NO_MATCHING_FACE);
    EXPECT_TRUE(result.subject_id.empty());
}

TEST_F(FaceRecognitionServiceTest, AuthenticateHonorsExplicitTolerance) {
    registerMember("member-1", axisEmbedding(0));

    model_->enqueueFace(embeddingWithSimilarity(0, 2, 0.95));
    AuthenticationResult strict = service_->authenticate(noiseImageBase64(9), 0.01);
    EXPECT_FALSE(strict.success);
    EXPECT_EQ(strict.error_kind, ErrorKind::NotFound);

    model_->enqueueFace(embeddingWithSimilarity(0, 2, 0.5));
    AuthenticationResult loose = service_->authenticate(noiseImageBase64(9), 0.6);
    ASSERT_TRUE(loose.success) << loose.error;
    EXPECT_NEAR(loose.distance, 0.5, 1e-9);
}

TEST_F(FaceRecognitionServiceTest, AuthenticateRejectsNonFiniteTolerance) {
    model_->enqueueFace(axisEmbedding(0));

    AuthenticationResult result = service_->authenticate(noiseImageBase64(), std::nan(""));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::InputValidation);
}

TEST_F(FaceRecognitionServiceTest, AuthenticateRejectsInactiveSubject) {
    registerMember("member-1", axisEmbedding(0));
    subjects_->setActive("member-1", false);

    model_->enqueueFace(axisEmbedding(0));
    AuthenticationResult result = service_->authenticate(noiseImageBase64(9));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::NotFound);
    EXPECT_EQ(result.error, ERROR_NO_MATCHING_FACE);
}

TEST_F(FaceRecognitionServiceTest, AuthenticateRejectsUnresolvableSubject) {
    // Record left behind for a subject the directory no longer knows
    store_->store("ghost", axisEmbedding(0), Bytes{0xFF, 0xD8, 0xFF}, "stub-face-model");

    model_->enqueueFace(axisEmbedding(0));
    AuthenticationResult result = service_->authenticate(noiseImageBase64(9));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ERROR_NO_MATCHING_FACE);
}

TEST_F(FaceRecognitionServiceTest, AuthenticateRefusesGroupPhoto) {
    registerMember("member-1", axisEmbedding(0));
    model_->enqueue({frontalFace(axisEmbedding(0)), frontalFace(axisEmbedding(1))});

    AuthenticationResult result = service_->authenticate(noiseImageBase64(9));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ERROR_MULTIPLE_FACES);
}

// ===== delete =====

TEST_F(FaceRecognitionServiceTest, DeleteDeactivatesRecord) {
    registerMember("member-1", axisEmbedding(0));

    DeletionResult result = service_->deleteFace("member-1");

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.message, FACE_DEACTIVATED_MESSAGE);
    EXPECT_EQ(result.deactivated, 1u);
    EXPECT_FALSE(store_->activeRecord("member-1").has_value());
    EXPECT_EQ(store_->history("member-1").size(), 1u);

    model_->enqueueFace(axisEmbedding(0));
    AuthenticationResult auth = service_->authenticate(noiseImageBase64(9));
    EXPECT_FALSE(auth.success);
    EXPECT_EQ(auth.error_kind, ErrorKind::NotFound);
}

TEST_F(FaceRecognitionServiceTest, DeleteWithoutActiveRecordIsNotFound) {
    DeletionResult result = service_->deleteFace("member-404");

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::NotFound);
    EXPECT_EQ(result.error, "No active face biometric found");
}

// ===== compare_two =====

TEST_F(FaceRecognitionServiceTest, CompareSameFace) {
    model_->enqueueFace(axisEmbedding(0));
    model_->enqueueFace(axisEmbedding(0));

    FaceComparisonResult result = service_->compareTwo(noiseImageBase64(1), noiseImageBase64(1));

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_TRUE(result.match);
    EXPECT_NEAR(result.distance, 0.0, 1e-9);
    EXPECT_NEAR(result.confidence, 1.0, 1e-9);
}

TEST_F(FaceRecognitionServiceTest, CompareDifferentFaces) {
    model_->enqueueFace(axisEmbedding(0));
    model_->enqueueFace(embeddingWithSimilarity(0, 1, 0.3));

    FaceComparisonResult result = service_->compareTwo(noiseImageBase64(1), noiseImageBase64(2));

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_FALSE(result.match);
    EXPECT_NEAR(result.similarity, 0.3, 1e-9);
    EXPECT_NEAR(result.distance, 0.7, 1e-9);
}

TEST_F(FaceRecognitionServiceTest, CompareClampsNegativeConfidence) {
    Embedding opposite = axisEmbedding(0);
    opposite[0] = -1.0;
    model_->enqueueFace(axisEmbedding(0));
    model_->enqueueFace(opposite);

    FaceComparisonResult result = service_->compareTwo(noiseImageBase64(1), noiseImageBase64(2));

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_NEAR(result.similarity, -1.0, 1e-9);
    EXPECT_DOUBLE_EQ(result.confidence, 0.0);
}

TEST_F(FaceRecognitionServiceTest, CompareUsesExplicitTolerance) {
    model_->enqueueFace(axisEmbedding(0));
    model_->enqueueFace(embeddingWithSimilarity(0, 1, 0.3));

    FaceComparisonResult result = service_->compareTwo(noiseImageBase64(1), noiseImageBase64(2), 0.25);

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_TRUE(result.match);
}

TEST_F(FaceRecognitionServiceTest, CompareReportsMissingFace) {
    model_->enqueueFace(axisEmbedding(0));
    model_->enqueue({});

    FaceComparisonResult result = service_->compareTwo(noiseImageBase64(1), noiseImageBase64(2));

    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error_kind, ErrorKind::DetectionFailure);
    EXPECT_EQ(result.error, ERROR_NO_FACE_DETECTED);
}

// ===== advisory operations =====

TEST_F(FaceRecognitionServiceTest, DetectAllReturnsEveryFace) {
    model_->enqueue({frontalFace(axisEmbedding(0)), frontalFace(axisEmbedding(1))});

    DetectionResult result = service_->detectAll(noiseImageBase64());

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.faces.size(), 2u);
}

TEST_F(FaceRecognitionServiceTest, AssessQualityReportsMetrics) {
    model_->enqueueFace(axisEmbedding(0));

    QualityAssessmentResult result = service_->assessQuality(noiseImageBase64());

    ASSERT_TRUE(result.success) << result.error;
    EXPECT_NEAR(result.report.face_ratio, 12000.0 / (TEST_WIDTH * TEST_HEIGHT), 1e-9);
    EXPECT_GE(result.report.score, 0.0);
    EXPECT_LE(result.report.score, 1.0);
}

TEST(FaceRecognitionServiceConstruction, RequiresStoreAndDirectory) {
    Settings settings;
    auto model = std::make_shared<StubFaceModel>();
    auto subjects = std::make_shared<SqliteSubjectDirectory>(":memory:");

    auto build = [&]() { FaceRecognitionService service(settings, model, nullptr, subjects); };
    EXPECT_THROW(build(), std::invalid_argument);
}
