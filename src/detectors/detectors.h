#ifndef GYMFACE_DETECTORS_H
#define GYMFACE_DETECTORS_H

#include "common.h"
#include <ncnn/net.h>
#include <vector>

namespace gymface {

// How the source image was resized and padded into the network input
struct Letterbox {
    float scale = 1.f;   // input_size / source_size
    int wpad = 0;        // total horizontal padding (split evenly left/right)
    int hpad = 0;        // total vertical padding (split evenly top/bottom)
    int orig_w = 0;
    int orig_h = 0;
};

// RetinaFace detector
// Model: RetinaFace (mnet.25-opt), input layer "data", raw RGB
// Output: faces with 5 landmarks, in source-image coordinates
std::vector<FaceObject> detectWithRetinaFace(const ncnn::Net& net, const ncnn::Mat& in,
                                             const Letterbox& box, float confidence_threshold);

// SCRFD detector
// Model: SCRFD (500m/2.5g/10g with keypoints), input layer "input.1",
// RGB normalized with mean 127.5 / scale 1/128, padded to a multiple of 32
// Output: faces with 5 landmarks (when the kps head exists), in source-image coordinates
std::vector<FaceObject> detectWithSCRFD(const ncnn::Net& net, const ncnn::Mat& in,
                                        const Letterbox& box, float confidence_threshold);

} // namespace gymface

#endif // GYMFACE_DETECTORS_H
