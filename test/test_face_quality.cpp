/**
 * @file test_face_quality.cpp
 * @brief Unit tests for FaceQualityScorer
 */

#include <gtest/gtest.h>
#include "face_quality.h"
#include "image_ops.h"
#include "test_support.h"
#include <algorithm>

using namespace gymface;
using namespace gymface::testing;

namespace {

bool hasIssue(const QualityReport& report, const std::string& issue) {
    return std::find(report.issues.begin(), report.issues.end(), issue) != report.issues.end();
}

} // namespace

class FaceQualityTest : public ::testing::Test {
protected:
    FaceQualityScorer scorer_{0.02};
    FaceDetection face_ = frontalFace(axisEmbedding(0));
};

TEST_F(FaceQualityTest, SharpWellSizedFaceScoresHigh) {
    Image frame = fromMat(noiseMat());

    QualityReport report = scorer_.assess(frame.view(), face_);

    EXPECT_NEAR(report.face_ratio, 12000.0 / (TEST_WIDTH * TEST_HEIGHT), 1e-12);
    EXPECT_FALSE(hasIssue(report, "Image is blurry"));
    EXPECT_FALSE(hasIssue(report, "Face is too small, move closer"));
    EXPECT_GT(report.sharpness, 300.0);
    EXPECT_GT(report.score, 0.5);
    EXPECT_LE(report.score, 1.0);
}

TEST_F(FaceQualityTest, DarkFlatFaceIsFlagged) {
    Image frame = fromMat(flatMat(TEST_WIDTH, TEST_HEIGHT, 20));

    QualityReport report = scorer_.assess(frame.view(), face_);

    EXPECT_NEAR(report.brightness, 20.0, 0.5);
    EXPECT_TRUE(hasIssue(report, "Image is too dark"));
    EXPECT_TRUE(hasIssue(report, "Image is blurry"));
    EXPECT_DOUBLE_EQ(report.sharpness, 0.0);
}

TEST_F(FaceQualityTest, BrightFaceIsFlagged) {
    Image frame = fromMat(flatMat(TEST_WIDTH, TEST_HEIGHT, 230));

    QualityReport report = scorer_.assess(frame.view(), face_);

    EXPECT_TRUE(hasIssue(report, "Image is too bright"));
}

TEST_F(FaceQualityTest, LightingIsMeasuredOnWholeFrame) {
    cv::Mat mat = flatMat(TEST_WIDTH, TEST_HEIGHT, 20);
    // Well-lit face box inside a dark frame
    mat(cv::Rect(face_.bbox.x, face_.bbox.y, face_.bbox.width, face_.bbox.height)).setTo(cv::Scalar(120, 120, 120));
    Image frame = fromMat(mat);

    QualityReport report = scorer_.assess(frame.view(), face_);

    const double expected = (120.0 * 12000 + 20.0 * (TEST_WIDTH * TEST_HEIGHT - 12000)) / (TEST_WIDTH * TEST_HEIGHT);
    EXPECT_NEAR(report.brightness, expected, 0.5);
    EXPECT_TRUE(hasIssue(report, "Image is too dark"));
}

TEST_F(FaceQualityTest, SizeIssues) {
    Image frame = fromMat(noiseMat());

    face_.bbox = Rect(150, 100, 10, 10);
    EXPECT_TRUE(hasIssue(scorer_.assess(frame.view(), face_), "Face is too small, move closer"));

    face_.bbox = Rect(0, 0, TEST_WIDTH, TEST_HEIGHT);
    EXPECT_TRUE(hasIssue(scorer_.assess(frame.view(), face_), "Face is too close to the camera"));
}

TEST_F(FaceQualityTest, BoxOutsideFrameKeepsScoreInRange) {
    Image frame = fromMat(noiseMat());
    face_.bbox = Rect(TEST_WIDTH - 40, TEST_HEIGHT - 40, 100, 100);

    QualityReport report = scorer_.assess(frame.view(), face_);

    EXPECT_GE(report.score, 0.0);
    EXPECT_LE(report.score, 1.0);
}
