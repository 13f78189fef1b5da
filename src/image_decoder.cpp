#include "image_decoder.h"
#include "image_ops.h"
#include "errors.h"
#include "logger.h"
#include <turbojpeg.h>
#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cstdio>
#include <cstdlib>

namespace gymface {

const char* imageFormatName(ImageFormat format) {
    switch (format) {
        case ImageFormat::JPEG: return "jpeg";
        case ImageFormat::PNG:  return "png";
        case ImageFormat::WEBP: return "webp";
        case ImageFormat::GIF:  return "gif";
        case ImageFormat::BMP:  return "bmp";
        case ImageFormat::TIFF: return "tiff";
        default:                return "unknown";
    }
}

ImageFormat sniffImageFormat(const Bytes& d) {
    auto starts_with = [&d](std::initializer_list<uint8_t> magic, size_t offset = 0) {
        if (d.size() < offset + magic.size()) return false;
        return std::equal(magic.begin(), magic.end(), d.begin() + offset);
    };

    if (starts_with({0xFF, 0xD8, 0xFF})) return ImageFormat::JPEG;
    if (starts_with({0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A})) return ImageFormat::PNG;
    if (starts_with({'R', 'I', 'F', 'F'}) && starts_with({'W', 'E', 'B', 'P'}, 8)) return ImageFormat::WEBP;
    if (starts_with({'G', 'I', 'F', '8'})) return ImageFormat::GIF;
    if (starts_with({'B', 'M'})) return ImageFormat::BMP;
    if (starts_with({'I', 'I', 0x2A, 0x00}) || starts_with({'M', 'M', 0x00, 0x2A})) return ImageFormat::TIFF;
    return ImageFormat::UNKNOWN;
}

namespace {

uint32_t readBE32(const Bytes& d, size_t at) {
    return (static_cast<uint32_t>(d[at]) << 24) | (static_cast<uint32_t>(d[at + 1]) << 16) |
           (static_cast<uint32_t>(d[at + 2]) << 8) | static_cast<uint32_t>(d[at + 3]);
}

uint32_t readLE16(const Bytes& d, size_t at) {
    return static_cast<uint32_t>(d[at]) | (static_cast<uint32_t>(d[at + 1]) << 8);
}

uint32_t readLE24(const Bytes& d, size_t at) {
    return readLE16(d, at) | (static_cast<uint32_t>(d[at + 2]) << 16);
}

uint32_t readLE32(const Bytes& d, size_t at) {
    return readLE24(d, at) | (static_cast<uint32_t>(d[at + 3]) << 24);
}

std::optional<ImageDimensions> webpDimensions(const Bytes& d) {
    if (d.size() < 30) return std::nullopt;

    const std::string chunk(d.begin() + 12, d.begin() + 16);
    if (chunk == "VP8 ") {
        // Key frame header: 3-byte tag, start code 9d 01 2a, then 14-bit sizes
        if (d[23] != 0x9d || d[24] != 0x01 || d[25] != 0x2a) return std::nullopt;
        return ImageDimensions{readLE16(d, 26) & 0x3fff, readLE16(d, 28) & 0x3fff};
    }
    if (chunk == "VP8L") {
        if (d[20] != 0x2f) return std::nullopt;
        const uint32_t bits = readLE32(d, 21);
        return ImageDimensions{(bits & 0x3fff) + 1, ((bits >> 14) & 0x3fff) + 1};
    }
    if (chunk == "VP8X") {
        return ImageDimensions{static_cast<long long>(readLE24(d, 24)) + 1,
                               static_cast<long long>(readLE24(d, 27)) + 1};
    }
    return std::nullopt;
}

} // namespace

std::optional<ImageDimensions> readImageDimensions(const Bytes& d, ImageFormat format) {
    switch (format) {
        case ImageFormat::PNG:
            // Signature, then the IHDR chunk: length, type, width, height (big-endian)
            if (d.size() < 24 || std::string(d.begin() + 12, d.begin() + 16) != "IHDR") return std::nullopt;
            return ImageDimensions{readBE32(d, 16), readBE32(d, 20)};
        case ImageFormat::WEBP:
            return webpDimensions(d);
        case ImageFormat::GIF:
            if (d.size() < 10) return std::nullopt;
            return ImageDimensions{readLE16(d, 6), readLE16(d, 8)};
        case ImageFormat::BMP: {
            if (d.size() < 26) return std::nullopt;
            // Negative height marks a top-down bitmap
            const long long w = static_cast<int32_t>(readLE32(d, 18));
            const long long h = static_cast<int32_t>(readLE32(d, 22));
            return ImageDimensions{std::llabs(w), std::llabs(h)};
        }
        default:
            return std::nullopt;
    }
}

ImageDecoder::ImageDecoder(const ImageSettings& settings)
    : settings_(settings) {
}

bool ImageDecoder::isFormatAllowed(ImageFormat format) const {
    if (format == ImageFormat::UNKNOWN) {
        return false;
    }

    std::string name = imageFormatName(format);
    for (const auto& allowed : settings_.allowed_formats) {
        if (allowed == name) return true;
        // "jpg" is the file-extension spelling of the JPEG container
        if (format == ImageFormat::JPEG && allowed == "jpg") return true;
        if (format == ImageFormat::TIFF && allowed == "tif") return true;
    }
    return false;
}

void ImageDecoder::checkSize(size_t bytes) const {
    const double limit_bytes = settings_.max_size_mb * 1024.0 * 1024.0;
    if (static_cast<double>(bytes) > limit_bytes) {
        char msg[160];
        std::snprintf(msg, sizeof(msg),
                      "Image size (%.2fMB) exceeds maximum allowed size of %gMB",
                      bytes / (1024.0 * 1024.0), settings_.max_size_mb);
        throw FaceError(ErrorKind::InputValidation, msg);
    }
}

void ImageDecoder::checkDimensions(long long width, long long height) const {
    // Per-side test first so the product cannot overflow for 32-bit header fields
    if (width > settings_.max_pixels || height > settings_.max_pixels ||
        width * height > settings_.max_pixels) {
        throw FaceError(ErrorKind::InputValidation,
            "Image dimensions " + std::to_string(width) + "x" + std::to_string(height) +
            " exceed the maximum of " + std::to_string(settings_.max_pixels) + " pixels");
    }
}

DecodedImage ImageDecoder::decode(const std::string& payload) const {
    // Strip "data:image/...;base64," style prefixes
    std::string encoded = payload;
    size_t comma = encoded.find(',');
    if (comma != std::string::npos) {
        encoded = encoded.substr(comma + 1);
    }

    auto bytes = base64Decode(encoded);
    if (!bytes) {
        throw FaceError(ErrorKind::InputValidation, "Invalid base64 image data");
    }

    return decodeBytes(*bytes);
}

DecodedImage ImageDecoder::decodeBytes(const Bytes& data) const {
    if (data.empty()) {
        throw FaceError(ErrorKind::InputValidation, "Image data is empty");
    }

    checkSize(data.size());

    ImageFormat format = sniffImageFormat(data);
    if (!isFormatAllowed(format)) {
        std::string allowed;
        for (size_t i = 0; i < settings_.allowed_formats.size(); i++) {
            if (i > 0) allowed += ", ";
            allowed += settings_.allowed_formats[i];
        }
        throw FaceError(ErrorKind::InputValidation,
            std::string("Invalid image format '") + imageFormatName(format) +
            "'. Allowed formats: " + allowed);
    }

    if (format != ImageFormat::JPEG) {
        if (auto dims = readImageDimensions(data, format)) {
            checkDimensions(dims->width, dims->height);
        }
    }

    DecodedImage result;
    result.format = format;
    result.encoded_size = data.size();
    result.pixels = (format == ImageFormat::JPEG) ? decodeJpeg(data) : decodeWithOpenCV(data);

    Logger::getInstance().debug(std::string("Decoded ") + imageFormatName(format) + " image " +
        std::to_string(result.pixels.width()) + "x" + std::to_string(result.pixels.height()) +
        " (" + std::to_string(data.size()) + " bytes)");
    return result;
}

Image ImageDecoder::decodeJpeg(const Bytes& data) const {
    tjhandle handle = tjInitDecompress();
    if (!handle) {
        throw FaceError(ErrorKind::Unexpected, "Failed to initialize TurboJPEG decompressor");
    }

    unsigned char* src = const_cast<unsigned char*>(data.data());
    int width = 0, height = 0, subsamp = 0, colorspace = 0;
    if (tjDecompressHeader3(handle, src, data.size(), &width, &height, &subsamp, &colorspace) < 0 ||
        width <= 0 || height <= 0) {
        Logger::getInstance().debug("tjDecompressHeader3 failed: " + std::string(tjGetErrorStr2(handle)));
        tjDestroy(handle);
        throw FaceError(ErrorKind::InputValidation, "Invalid image data");
    }

    try {
        checkDimensions(width, height);
    } catch (const FaceError&) {
        tjDestroy(handle);
        throw;
    }

    Image frame(width, height, 3);
    if (tjDecompress2(handle, src, data.size(), frame.data(), width, frame.stride(), height,
                      TJPF_BGR, 0) < 0) {
        // Warnings (e.g. premature end of data) still yield a usable frame
        if (tjGetErrorCode(handle) == TJERR_FATAL) {
            Logger::getInstance().debug("tjDecompress2 failed: " + std::string(tjGetErrorStr2(handle)));
            tjDestroy(handle);
            throw FaceError(ErrorKind::InputValidation, "Invalid image data");
        }
        Logger::getInstance().debug("tjDecompress2 warning: " + std::string(tjGetErrorStr2(handle)));
    }

    tjDestroy(handle);
    return frame;
}

Image ImageDecoder::decodeWithOpenCV(const Bytes& data) const {
    cv::Mat raw(1, static_cast<int>(data.size()), CV_8UC1, const_cast<uint8_t*>(data.data()));
    cv::Mat decoded;
    try {
        decoded = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        Logger::getInstance().debug(std::string("cv::imdecode threw: ") + e.what());
        throw FaceError(ErrorKind::InputValidation, "Invalid image data");
    }

    if (decoded.empty()) {
        throw FaceError(ErrorKind::InputValidation, "Invalid image data");
    }
    // Formats without a parsed header (TIFF) are only bounded here
    checkDimensions(decoded.cols, decoded.rows);

    // 16-bit PNGs are narrowed to 8 bits per channel
    if (decoded.depth() != CV_8U) {
        cv::Mat narrowed;
        decoded.convertTo(narrowed, CV_8U, 1.0 / 257.0);
        decoded = narrowed;
    }

    return fromMat(decoded);
}

} // namespace gymface
