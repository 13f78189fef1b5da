#ifndef GYMFACE_IMAGE_DECODER_H
#define GYMFACE_IMAGE_DECODER_H

#include "image.h"
#include "settings.h"
#include "crypto_utils.h"
#include <optional>
#include <string>

namespace gymface {

enum class ImageFormat {
    JPEG,
    PNG,
    WEBP,
    GIF,
    BMP,
    TIFF,
    UNKNOWN
};

const char* imageFormatName(ImageFormat format);

// Container format from the leading magic bytes
ImageFormat sniffImageFormat(const Bytes& data);

struct ImageDimensions {
    long long width = 0;
    long long height = 0;
};

// Width and height declared by the container header, without decoding pixels.
// Empty when the header is truncated or the format is not parsed (TIFF).
std::optional<ImageDimensions> readImageDimensions(const Bytes& data, ImageFormat format);

struct DecodedImage {
    Image pixels;         // 3-channel BGR
    ImageFormat format = ImageFormat::UNKNOWN;
    size_t encoded_size = 0;
};

// Turns a base64 payload (optionally a data URI) into pixels, enforcing size, format and
// pixel-count limits.
// All rejections throw FaceError(InputValidation).
class ImageDecoder {
public:
    explicit ImageDecoder(const ImageSettings& settings);

    DecodedImage decode(const std::string& payload) const;

    // Same checks on already-decoded bytes
    DecodedImage decodeBytes(const Bytes& data) const;

    bool isFormatAllowed(ImageFormat format) const;

private:
    ImageSettings settings_;

    void checkSize(size_t bytes) const;
    void checkDimensions(long long width, long long height) const;
    Image decodeJpeg(const Bytes& data) const;
    Image decodeWithOpenCV(const Bytes& data) const;
};

} // namespace gymface

#endif // GYMFACE_IMAGE_DECODER_H
