#include "image_ops.h"
#include "errors.h"
#include "logger.h"
#include <libyuv.h>
#include <turbojpeg.h>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <cstring>

namespace gymface {

// libyuv "RGB24" is B,G,R in memory, which is OpenCV's BGR layout
Image resizeImage(const ImageView& src, int dst_width, int dst_height) {
    Image src_argb(src.width(), src.height(), 4);
    libyuv::RGB24ToARGB(src.data(), src.stride(), src_argb.data(), src_argb.stride(),
                        src.width(), src.height());

    Image dst_argb(dst_width, dst_height, 4);
    libyuv::ARGBScale(
        src_argb.data(), src_argb.stride(),
        src_argb.width(), src_argb.height(),
        dst_argb.data(), dst_argb.stride(),
        dst_argb.width(), dst_argb.height(),
        libyuv::kFilterBilinear
    );

    Image result(dst_width, dst_height, 3);
    libyuv::ARGBToRGB24(dst_argb.data(), dst_argb.stride(), result.data(), result.stride(),
                        dst_width, dst_height);
    return result;
}

Image toGrayscale(const ImageView& src) {
    Image dst_gray(src.width(), src.height(), 1);
    libyuv::RGB24ToJ400(src.data(), src.stride(), dst_gray.data(), dst_gray.stride(),
                        src.width(), src.height());
    return dst_gray;
}

cv::Mat asMat(const ImageView& view) {
    int type = view.channels() == 1 ? CV_8UC1 : (view.channels() == 4 ? CV_8UC4 : CV_8UC3);
    return cv::Mat(view.height(), view.width(), type,
                   const_cast<uint8_t*>(view.data()), static_cast<size_t>(view.stride()));
}

Image fromMat(const cv::Mat& mat) {
    if (mat.empty() || mat.depth() != CV_8U) {
        throw FaceError(ErrorKind::InputValidation, "Invalid image data");
    }

    cv::Mat bgr;
    switch (mat.channels()) {
        case 1: cv::cvtColor(mat, bgr, cv::COLOR_GRAY2BGR); break;
        case 4: cv::cvtColor(mat, bgr, cv::COLOR_BGRA2BGR); break;
        case 3: bgr = mat; break;
        default:
            throw FaceError(ErrorKind::InputValidation, "Unsupported channel count: " +
                            std::to_string(mat.channels()));
    }

    Image out(bgr.cols, bgr.rows, 3);
    for (int y = 0; y < bgr.rows; y++) {
        std::memcpy(out.data() + static_cast<size_t>(y) * out.stride(), bgr.ptr<uint8_t>(y),
                    static_cast<size_t>(bgr.cols) * 3);
    }
    return out;
}

Bytes encodeJpeg(const ImageView& src, int quality) {
    tjhandle handle = tjInitCompress();
    if (!handle) {
        throw FaceError(ErrorKind::Unexpected, "Failed to initialize TurboJPEG compressor");
    }

    unsigned char* jpeg_buf = nullptr;
    unsigned long jpeg_size = 0;
    int ret = tjCompress2(handle, src.data(), src.width(), src.stride(), src.height(),
                          TJPF_BGR, &jpeg_buf, &jpeg_size, TJSAMP_420,
                          std::clamp(quality, 1, 100), TJFLAG_FASTDCT);
    if (ret < 0) {
        std::string reason = tjGetErrorStr2(handle);
        tjFree(jpeg_buf);
        tjDestroy(handle);
        throw FaceError(ErrorKind::Unexpected, "JPEG encoding failed: " + reason);
    }

    Bytes out(jpeg_buf, jpeg_buf + jpeg_size);
    tjFree(jpeg_buf);
    tjDestroy(handle);
    return out;
}

Image makeThumbnail(const ImageView& src, int max_width, int max_height) {
    double scale = std::min(static_cast<double>(max_width) / src.width(),
                            static_cast<double>(max_height) / src.height());
    if (scale >= 1.0) {
        return src.clone();
    }

    int w = std::max(1, static_cast<int>(std::round(src.width() * scale)));
    int h = std::max(1, static_cast<int>(std::round(src.height() * scale)));
    Logger::getInstance().debug("Thumbnail " + std::to_string(src.width()) + "x" +
        std::to_string(src.height()) + " -> " + std::to_string(w) + "x" + std::to_string(h));
    return resizeImage(src, w, h);
}

} // namespace gymface
