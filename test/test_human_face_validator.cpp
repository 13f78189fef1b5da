/**
 * @file test_human_face_validator.cpp
 * @brief Unit tests for HumanFaceValidator
 */

#include <gtest/gtest.h>
#include "human_face_validator.h"
#include "test_support.h"
#include <stdexcept>

using namespace gymface;
using namespace gymface::testing;

class HumanFaceValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        face_ = frontalFace(axisEmbedding(0));
    }

    FaceValidationResult validate(const HumanFaceValidator& validator) const {
        return validator.validate(face_, TEST_WIDTH, TEST_HEIGHT);
    }

    ValidationSettings settings_;
    FaceDetection face_;
};

TEST_F(HumanFaceValidatorTest, FrontalFacePasses) {
    HumanFaceValidator validator(settings_);

    FaceValidationResult result = validate(validator);

    EXPECT_TRUE(result.is_valid) << result.reason;
    EXPECT_TRUE(result.failed_check.empty());
}

TEST_F(HumanFaceValidatorTest, ChecksRunInDocumentedOrder) {
    HumanFaceValidator validator(settings_);

    ASSERT_EQ(validator.checks().size(), 4u);
    EXPECT_EQ(validator.checks()[0].name, "characteristics");
    EXPECT_EQ(validator.checks()[1].name, "size");
    EXPECT_EQ(validator.checks()[2].name, "angle");
    EXPECT_EQ(validator.checks()[3].name, "landmarks");
    EXPECT_EQ(validator.checks()[2].policy, FailurePolicy::Open);
    EXPECT_EQ(validator.checks()[1].policy, FailurePolicy::Closed);
}

TEST_F(HumanFaceValidatorTest, RejectsAgeOutsideRange) {
    HumanFaceValidator validator(settings_);

    face_.age = 2;
    FaceValidationResult young = validate(validator);
    EXPECT_FALSE(young.is_valid);
    EXPECT_EQ(young.failed_check, "characteristics");
    EXPECT_EQ(young.reason, std::string(ERROR_INVALID_HUMAN_FACE) + ". Estimated age out of range (2 years)");

    face_.age = 101;
    EXPECT_FALSE(validate(validator).is_valid);

    face_.age = 100;
    EXPECT_TRUE(validate(validator).is_valid);
}

TEST_F(HumanFaceValidatorTest, MissingAgeAndGenderAreAccepted) {
    HumanFaceValidator validator(settings_);
    face_.age.reset();
    face_.gender.reset();

    EXPECT_TRUE(validate(validator).is_valid);
}

TEST_F(HumanFaceValidatorTest, RejectsOutOfRangeGenderCode) {
    HumanFaceValidator validator(settings_);
    face_.gender = static_cast<Gender>(7);

    FaceValidationResult result = validate(validator);

    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.failed_check, "characteristics");
}

TEST_F(HumanFaceValidatorTest, RejectsSmallFace) {
    HumanFaceValidator validator(settings_);
    face_.bbox = Rect(150, 100, 20, 20);  // 400 / 76800 < 0.02

    FaceValidationResult result = validate(validator);

    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.failed_check, "size");
    EXPECT_EQ(result.reason, ERROR_FACE_TOO_SMALL);
}

TEST_F(HumanFaceValidatorTest, EstimatesRollAndTilt) {
    // Level eyes, nose 25px under a 50px eye line: tilt atan(0.5)
    EXPECT_NEAR(HumanFaceValidator::estimateAngle(face_.landmarks), 26.565, 0.01);

    // Eyes rotated 60 degrees dominate the nose tilt
    std::vector<Point> rolled = {Point(0, 0), Point(50, 86.6025f), Point(10, 50)};
    EXPECT_NEAR(HumanFaceValidator::estimateAngle(rolled), 60.0, 0.01);

    EXPECT_THROW(HumanFaceValidator::estimateAngle({Point(0, 0), Point(1, 1)}), std::invalid_argument);
}

TEST_F(HumanFaceValidatorTest, RejectsExtremeAngle) {
    settings_.max_face_angle = 20.0;
    HumanFaceValidator validator(settings_);

    FaceValidationResult result = validate(validator);

    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.failed_check, "angle");
    EXPECT_EQ(result.reason, ERROR_INVALID_FACE_ANGLE);
}

TEST_F(HumanFaceValidatorTest, FallsBackToBoxAspectWithoutLandmarks) {
    HumanFaceValidator validator(settings_);

    FaceDetection profile = face_;
    profile.landmarks.clear();
    profile.bbox = Rect(100, 40, 40, 100);  // aspect 0.4
    EXPECT_EQ(validator.checkAngle(profile), std::optional<std::string>(ERROR_INVALID_FACE_ANGLE));

    profile.bbox = Rect(100, 40, 90, 100);
    EXPECT_FALSE(validator.checkAngle(profile).has_value());
}

TEST_F(HumanFaceValidatorTest, AngleFailureIsOpen) {
    HumanFaceValidator validator(settings_);
    auto checks = validator.checks();
    checks[2].run = [](const FaceDetection&, int, int) -> ValidationOutcome {
        throw std::runtime_error("pose estimator unavailable");
    };
    validator.setChecks(checks);

    EXPECT_TRUE(validate(validator).is_valid);
}

TEST_F(HumanFaceValidatorTest, SizeFailureIsClosed) {
    HumanFaceValidator validator(settings_);
    auto checks = validator.checks();
    checks[1].run = [](const FaceDetection&, int, int) -> ValidationOutcome {
        throw std::runtime_error("bad geometry");
    };
    validator.setChecks(checks);

    FaceValidationResult result = validate(validator);

    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.failed_check, "size");
    EXPECT_EQ(result.reason, ERROR_FACE_TOO_SMALL);
}

TEST_F(HumanFaceValidatorTest, RejectsMissingLandmarks) {
    HumanFaceValidator validator(settings_);
    face_.landmarks.clear();

    FaceValidationResult result = validate(validator);

    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.failed_check, "landmarks");
    EXPECT_EQ(result.reason, std::string(ERROR_INVALID_HUMAN_FACE) + ". Facial landmarks not available");
}

TEST_F(HumanFaceValidatorTest, RejectsTooFewLandmarks) {
    HumanFaceValidator validator(settings_);
    face_.landmarks.resize(3);

    FaceValidationResult result = validate(validator);

    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.failed_check, "characteristics");

    EXPECT_EQ(validator.checkLandmarks(face_),
              std::optional<std::string>(std::string(ERROR_INVALID_HUMAN_FACE) + ". Insufficient facial landmarks (3)"));
}

TEST_F(HumanFaceValidatorTest, RejectsClusteredLandmarks) {
    HumanFaceValidator validator(settings_);
    face_.landmarks = {
        Point(150, 100), Point(155, 100), Point(152, 103), Point(151, 105), Point(154, 105),
    };

    FaceValidationResult result = validate(validator);

    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.failed_check, "landmarks");
    EXPECT_EQ(result.reason, std::string(ERROR_INVALID_HUMAN_FACE) + ". Facial landmarks are poorly distributed");
}
