/*
 * Pixel Containers for gymface
 *
 * Ownership rules:
 * - ImageView: non-owning view (move-only, never outlives its source)
 * - Image: owning buffer (move-only, explicit clone)
 * - Rect / Point: plain geometry used by detectors and validators
 *
 * All color images are 3-channel BGR, 8 bits per channel.
 */

#ifndef GYMFACE_IMAGE_H
#define GYMFACE_IMAGE_H

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <algorithm>
#include <new>

namespace gymface {

class Image;
class ImageView;

// ========== Point: Landmark Coordinate ==========

struct Point {
    float x, y;

    constexpr Point() noexcept : x(0.0f), y(0.0f) {}
    constexpr Point(float x_, float y_) noexcept : x(x_), y(y_) {}
};

// ========== Rect: Bounding Rectangle ==========

struct Rect {
    int x, y, width, height;

    constexpr Rect() noexcept : x(0), y(0), width(0), height(0) {}
    constexpr Rect(int x_, int y_, int w, int h) noexcept
        : x(x_), y(y_), width(w), height(h) {}

    // Intersection with bounds (clip to frame)
    Rect& operator&=(const Rect& bounds) noexcept {
        int x2 = std::min(x + width, bounds.x + bounds.width);
        int y2 = std::min(y + height, bounds.y + bounds.height);
        x = std::max(x, bounds.x);
        y = std::max(y, bounds.y);
        width = std::max(0, x2 - x);
        height = std::max(0, y2 - y);
        return *this;
    }

    constexpr bool empty() const noexcept {
        return width <= 0 || height <= 0;
    }

    constexpr long long area() const noexcept {
        return static_cast<long long>(width) * height;
    }

    constexpr int centerX() const noexcept {
        return x + width / 2;
    }

    constexpr int centerY() const noexcept {
        return y + height / 2;
    }
};

// ========== ImageView: Non-Owning View ==========

class ImageView {
public:
    ImageView(uint8_t* data, int width, int height, int channels, int stride = 0) noexcept
        : data_(data), width_(width), height_(height),
          channels_(channels), stride_(stride > 0 ? stride : width * channels) {}

    // Views can't be copied (forces explicit intent)
    ImageView(const ImageView&) = delete;
    ImageView& operator=(const ImageView&) = delete;

    ImageView(ImageView&& other) noexcept
        : data_(other.data_), width_(other.width_), height_(other.height_),
          channels_(other.channels_), stride_(other.stride_) {
        other.data_ = nullptr;
    }

    ImageView& operator=(ImageView&& other) noexcept {
        data_ = other.data_;
        width_ = other.width_;
        height_ = other.height_;
        channels_ = other.channels_;
        stride_ = other.stride_;
        other.data_ = nullptr;
        return *this;
    }

    uint8_t* data() noexcept { return data_; }
    const uint8_t* data() const noexcept { return data_; }
    constexpr int width() const noexcept { return width_; }
    constexpr int height() const noexcept { return height_; }
    constexpr int stride() const noexcept { return stride_; }
    constexpr int channels() const noexcept { return channels_; }
    constexpr bool empty() const noexcept { return data_ == nullptr || width_ == 0 || height_ == 0; }
    constexpr long long pixelCount() const noexcept { return static_cast<long long>(width_) * height_; }

    // ROI extraction (caller clips the rect to the frame first)
    ImageView roi(const Rect& rect) const noexcept {
        uint8_t* roi_data = data_ + static_cast<size_t>(rect.y) * stride_ + static_cast<size_t>(rect.x) * channels_;
        return ImageView(roi_data, rect.width, rect.height, channels_, stride_);
    }

    Image clone() const;

private:
    uint8_t* data_;
    int width_;
    int height_;
    int channels_;
    int stride_;
};

// ========== Image: Owning Image (Move-Only) ==========

class Image {
public:
    Image() noexcept
        : data_(nullptr), width_(0), height_(0), channels_(0), stride_(0) {}

    // Allocating constructor (64-byte aligned, zero-filled)
    Image(int width, int height, int channels)
        : data_(nullptr), width_(width), height_(height), channels_(channels),
          stride_(width * channels) {
        if (width <= 0 || height <= 0 || channels <= 0) {
            throw std::invalid_argument("Image dimensions must be positive");
        }

        size_t size = static_cast<size_t>(stride_) * height_;
        size_t aligned_size = (size + 63) & ~static_cast<size_t>(63);

        if (posix_memalign(reinterpret_cast<void**>(&data_), 64, aligned_size) != 0) {
            throw std::bad_alloc();
        }
        std::memset(data_, 0, aligned_size);
    }

    ~Image() noexcept {
        free(data_);
    }

    Image(const Image&) = delete;
    Image& operator=(const Image&) = delete;

    Image(Image&& other) noexcept
        : data_(other.data_), width_(other.width_), height_(other.height_),
          channels_(other.channels_), stride_(other.stride_) {
        other.data_ = nullptr;
        other.width_ = 0;
        other.height_ = 0;
    }

    Image& operator=(Image&& other) noexcept {
        if (this != &other) {
            free(data_);

            data_ = other.data_;
            width_ = other.width_;
            height_ = other.height_;
            channels_ = other.channels_;
            stride_ = other.stride_;

            other.data_ = nullptr;
            other.width_ = 0;
            other.height_ = 0;
        }
        return *this;
    }

    uint8_t* data() noexcept { return data_; }
    const uint8_t* data() const noexcept { return data_; }
    constexpr int width() const noexcept { return width_; }
    constexpr int height() const noexcept { return height_; }
    constexpr int stride() const noexcept { return stride_; }
    constexpr int channels() const noexcept { return channels_; }
    constexpr bool empty() const noexcept { return data_ == nullptr || width_ == 0 || height_ == 0; }
    constexpr long long pixelCount() const noexcept { return static_cast<long long>(width_) * height_; }

    // Non-owning view (view lifetime must be < image lifetime)
    ImageView view() const noexcept {
        return ImageView(const_cast<uint8_t*>(data_), width_, height_, channels_, stride_);
    }

    Image clone() const {
        return view().clone();
    }

private:
    uint8_t* data_;
    int width_;
    int height_;
    int channels_;
    int stride_;
};

inline Image ImageView::clone() const {
    if (empty()) {
        return Image();
    }

    Image copy(width_, height_, channels_);

    // Copy row by row (handles stride)
    for (int y = 0; y < height_; y++) {
        std::memcpy(
            copy.data() + static_cast<size_t>(y) * copy.stride(),
            data_ + static_cast<size_t>(y) * stride_,
            static_cast<size_t>(width_) * channels_
        );
    }

    return copy;
}

} // namespace gymface

#endif // GYMFACE_IMAGE_H
