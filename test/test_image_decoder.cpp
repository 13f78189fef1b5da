/**
 * @file test_image_decoder.cpp
 * @brief Unit tests for ImageDecoder
 */

#include <gtest/gtest.h>
#include "errors.h"
#include "image_decoder.h"
#include "test_support.h"

using namespace gymface;
using namespace gymface::testing;

namespace {

// Runs fn and returns the FaceError message; fails the test when nothing is thrown
template <typename Fn>
std::string inputErrorOf(Fn fn) {
    try {
        fn();
    } catch (const FaceError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::InputValidation);
        return e.what();
    }
    ADD_FAILURE() << "expected FaceError(InputValidation)";
    return "";
}

} // namespace

class ImageDecoderTest : public ::testing::Test {
protected:
    ImageSettings settings_;
};

TEST_F(ImageDecoderTest, SniffsContainerFormats) {
    EXPECT_EQ(sniffImageFormat({0xFF, 0xD8, 0xFF, 0xE0}), ImageFormat::JPEG);
    EXPECT_EQ(sniffImageFormat({0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A}), ImageFormat::PNG);
    EXPECT_EQ(sniffImageFormat({'R', 'I', 'F', 'F', 0, 0, 0, 0, 'W', 'E', 'B', 'P'}), ImageFormat::WEBP);
    EXPECT_EQ(sniffImageFormat({'G', 'I', 'F', '8', '9', 'a'}), ImageFormat::GIF);
    EXPECT_EQ(sniffImageFormat({'B', 'M', 0, 0}), ImageFormat::BMP);
    EXPECT_EQ(sniffImageFormat({0x00, 0x01}), ImageFormat::UNKNOWN);
}

TEST_F(ImageDecoderTest, DecodesPng) {
    ImageDecoder decoder(settings_);

    DecodedImage decoded = decoder.decode(pngBase64(noiseMat(64, 48)));

    EXPECT_EQ(decoded.format, ImageFormat::PNG);
    EXPECT_EQ(decoded.pixels.width(), 64);
    EXPECT_EQ(decoded.pixels.height(), 48);
    EXPECT_EQ(decoded.pixels.channels(), 3);
    EXPECT_GT(decoded.encoded_size, 0u);
}

TEST_F(ImageDecoderTest, DecodesJpeg) {
    ImageDecoder decoder(settings_);

    DecodedImage decoded = decoder.decode(jpegBase64(flatMat(80, 60)));

    EXPECT_EQ(decoded.format, ImageFormat::JPEG);
    EXPECT_EQ(decoded.pixels.width(), 80);
    EXPECT_EQ(decoded.pixels.height(), 60);
    EXPECT_EQ(decoded.pixels.channels(), 3);
}

TEST_F(ImageDecoderTest, AcceptsDataUriPrefix) {
    ImageDecoder decoder(settings_);

    DecodedImage decoded = decoder.decode("data:image/png;base64," + pngBase64(flatMat(16, 16)));

    EXPECT_EQ(decoded.pixels.width(), 16);
}

TEST_F(ImageDecoderTest, RejectsInvalidBase64) {
    ImageDecoder decoder(settings_);

    EXPECT_EQ(inputErrorOf([&] { decoder.decode("***"); }), "Invalid base64 image data");
}

TEST_F(ImageDecoderTest, RejectsEmptyBytes) {
    ImageDecoder decoder(settings_);

    EXPECT_EQ(inputErrorOf([&] { decoder.decodeBytes(Bytes{}); }), "Image data is empty");
}

TEST_F(ImageDecoderTest, RejectsOversizedPayload) {
    settings_.max_size_mb = 0.01;
    ImageDecoder decoder(settings_);

    std::string message = inputErrorOf([&] { decoder.decode(noiseImageBase64()); });

    EXPECT_NE(message.find("exceeds maximum allowed size of 0.01MB"), std::string::npos) << message;
}

TEST_F(ImageDecoderTest, RejectsFormatOutsideAllowList) {
    settings_.allowed_formats = {"jpg", "jpeg"};
    ImageDecoder decoder(settings_);

    std::string message = inputErrorOf([&] { decoder.decode(pngBase64(flatMat(16, 16))); });

    EXPECT_EQ(message, "Invalid image format 'png'. Allowed formats: jpg, jpeg");
}

TEST_F(ImageDecoderTest, RejectsUnrecognizedBytes) {
    ImageDecoder decoder(settings_);

    std::string message = inputErrorOf([&] { decoder.decodeBytes(Bytes{'G', 'I', 'F', '8', '9', 'a', 1, 0, 1, 0}); });

    EXPECT_EQ(message.rfind("Invalid image format", 0), 0u) << message;
}

TEST_F(ImageDecoderTest, RejectsCorruptImageData) {
    ImageDecoder decoder(settings_);

    Bytes png = encodeMat(noiseMat(32, 32), ".png");
    png.resize(40);

    EXPECT_EQ(inputErrorOf([&] { decoder.decodeBytes(png); }), "Invalid image data");
}

TEST_F(ImageDecoderTest, JpgAndJpegNamesAreInterchangeable) {
    settings_.allowed_formats = {"jpg"};
    ImageDecoder decoder(settings_);

    EXPECT_TRUE(decoder.isFormatAllowed(ImageFormat::JPEG));
    EXPECT_FALSE(decoder.isFormatAllowed(ImageFormat::PNG));
}

TEST_F(ImageDecoderTest, ReadsHeaderDimensions) {
    Bytes png = encodeMat(noiseMat(64, 48), ".png");
    Bytes gif = {'G', 'I', 'F', '8', '9', 'a', 0x40, 0x01, 0xF0, 0x00};

    auto png_dims = readImageDimensions(png, ImageFormat::PNG);
    auto gif_dims = readImageDimensions(gif, ImageFormat::GIF);

    ASSERT_TRUE(png_dims.has_value());
    EXPECT_EQ(png_dims->width, 64);
    EXPECT_EQ(png_dims->height, 48);
    ASSERT_TRUE(gif_dims.has_value());
    EXPECT_EQ(gif_dims->width, 320);
    EXPECT_EQ(gif_dims->height, 240);
    EXPECT_FALSE(readImageDimensions(Bytes{0x89, 'P', 'N', 'G'}, ImageFormat::PNG).has_value());
}

TEST_F(ImageDecoderTest, RejectsPngDeclaringTooManyPixels) {
    ImageDecoder decoder(settings_);

    // Signature and an IHDR chunk declaring 30000x30000; no pixel data follows
    Bytes png = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A,
                 0x00, 0x00, 0x00, 0x0D, 'I', 'H', 'D', 'R',
                 0x00, 0x00, 0x75, 0x30, 0x00, 0x00, 0x75, 0x30,
                 0x08, 0x02, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00};

    EXPECT_EQ(inputErrorOf([&] { decoder.decodeBytes(png); }),
              "Image dimensions 30000x30000 exceed the maximum of 89478485 pixels");
}

TEST_F(ImageDecoderTest, EnforcesConfiguredPixelLimit) {
    settings_.max_pixels = 1000;
    ImageDecoder decoder(settings_);

    EXPECT_EQ(inputErrorOf([&] { decoder.decode(pngBase64(flatMat(40, 30))); }),
              "Image dimensions 40x30 exceed the maximum of 1000 pixels");
    EXPECT_EQ(inputErrorOf([&] { decoder.decode(jpegBase64(flatMat(40, 30))); }),
              "Image dimensions 40x30 exceed the maximum of 1000 pixels");

    DecodedImage small = decoder.decode(pngBase64(flatMat(25, 40)));
    EXPECT_EQ(small.pixels.pixelCount(), 1000);
}
