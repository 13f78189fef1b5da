#ifndef GYMFACE_IMAGE_OPS_H
#define GYMFACE_IMAGE_OPS_H

#include "image.h"
#include "crypto_utils.h"
#include <opencv2/core.hpp>

namespace gymface {

// Bilinear resize of a 3-channel BGR image (libyuv)
Image resizeImage(const ImageView& src, int dst_width, int dst_height);

// Full-range BGR to grayscale (libyuv J400)
Image toGrayscale(const ImageView& src);

// Zero-copy cv::Mat header over a view; the view must outlive the Mat
cv::Mat asMat(const ImageView& view);

// Deep copy of an 8-bit Mat into a 3-channel BGR Image (gray and BGRA are expanded/dropped)
Image fromMat(const cv::Mat& mat);

// Encode a 3-channel BGR view to JPEG (TurboJPEG); throws FaceError on encoder failure
Bytes encodeJpeg(const ImageView& src, int quality);

// Downscale to fit inside max_width x max_height, keeping aspect ratio; never upscales
Image makeThumbnail(const ImageView& src, int max_width, int max_height);

} // namespace gymface

#endif // GYMFACE_IMAGE_OPS_H
