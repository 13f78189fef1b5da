#ifndef GYMFACE_DETECTORS_COMMON_H
#define GYMFACE_DETECTORS_COMMON_H

#include "../image.h"
#include <ncnn/net.h>
#include <vector>
#include <algorithm>
#include <cmath>

namespace gymface {

// Raw detector output in network-input coordinates
struct FaceObject {
    float x = 0.f, y = 0.f, width = 0.f, height = 0.f;
    float prob = 0.f;
    std::vector<Point> landmarks;  // 5 points when the model has a keypoint head
};

inline float intersection_area(const FaceObject& a, const FaceObject& b) {
    float x1 = std::max(a.x, b.x);
    float y1 = std::max(a.y, b.y);
    float x2 = std::min(a.x + a.width, b.x + b.width);
    float y2 = std::min(a.y + a.height, b.y + b.height);

    if (x2 < x1 || y2 < y1) return 0.0f;
    return (x2 - x1) * (y2 - y1);
}

// Descending sort by probability
inline void qsort_descent_inplace(std::vector<FaceObject>& faceobjects) {
    std::sort(faceobjects.begin(), faceobjects.end(),
              [](const FaceObject& a, const FaceObject& b) { return a.prob > b.prob; });
}

// Non-Maximum Suppression over bboxes sorted by descending probability
inline void nms_sorted_bboxes(const std::vector<FaceObject>& faceobjects, std::vector<int>& picked, float nms_threshold) {
    picked.clear();
    const int n = static_cast<int>(faceobjects.size());

    std::vector<float> areas(n);
    for (int i = 0; i < n; i++) {
        areas[i] = faceobjects[i].width * faceobjects[i].height;
    }

    for (int i = 0; i < n; i++) {
        const FaceObject& a = faceobjects[i];

        bool keep = true;
        for (int j : picked) {
            const FaceObject& b = faceobjects[j];
            float inter_area = intersection_area(a, b);
            float union_area = areas[i] + areas[j] - inter_area;
            if (union_area > 0.f && inter_area / union_area > nms_threshold) {
                keep = false;
                break;
            }
        }

        if (keep) picked.push_back(i);
    }
}

// Anchor boxes of one feature level, centered on the first cell (RetinaFace) or on the origin (SCRFD)
inline ncnn::Mat generate_anchors(int base_size, const ncnn::Mat& ratios, const ncnn::Mat& scales, bool centered_at_origin) {
    int num_ratio = ratios.w;
    int num_scale = scales.w;

    ncnn::Mat anchors;
    anchors.create(4, num_ratio * num_scale);

    const float cx = centered_at_origin ? 0.f : base_size * 0.5f;
    const float cy = centered_at_origin ? 0.f : base_size * 0.5f;

    for (int i = 0; i < num_ratio; i++) {
        float ar = ratios[i];
        int r_w = static_cast<int>(std::round(base_size / std::sqrt(ar)));
        int r_h = static_cast<int>(std::round(r_w * ar));

        for (int j = 0; j < num_scale; j++) {
            float scale = scales[j];
            float rs_w = r_w * scale;
            float rs_h = r_h * scale;

            float* anchor = anchors.row(i * num_scale + j);
            anchor[0] = cx - rs_w * 0.5f;
            anchor[1] = cy - rs_h * 0.5f;
            anchor[2] = cx + rs_w * 0.5f;
            anchor[3] = cy + rs_h * 0.5f;
        }
    }

    return anchors;
}

// Map picked proposals from letterboxed network input back to the source image, clipping to its bounds
inline std::vector<FaceObject> restore_to_image(const std::vector<FaceObject>& proposals,
                                                const std::vector<int>& picked,
                                                float scale, int wpad, int hpad,
                                                int orig_w, int orig_h) {
    std::vector<FaceObject> faces;
    faces.reserve(picked.size());

    auto clampf = [](float v, float hi) { return std::max(std::min(v, hi), 0.f); };

    for (int idx : picked) {
        const FaceObject& obj = proposals[idx];

        float x0 = clampf((obj.x - wpad / 2.0f) / scale, static_cast<float>(orig_w - 1));
        float y0 = clampf((obj.y - hpad / 2.0f) / scale, static_cast<float>(orig_h - 1));
        float x1 = clampf((obj.x + obj.width - wpad / 2.0f) / scale, static_cast<float>(orig_w - 1));
        float y1 = clampf((obj.y + obj.height - hpad / 2.0f) / scale, static_cast<float>(orig_h - 1));

        if (x1 <= x0 || y1 <= y0) continue;

        FaceObject face;
        face.x = x0;
        face.y = y0;
        face.width = x1 - x0;
        face.height = y1 - y0;
        face.prob = obj.prob;
        for (const Point& p : obj.landmarks) {
            face.landmarks.emplace_back((p.x - wpad / 2.0f) / scale, (p.y - hpad / 2.0f) / scale);
        }
        faces.push_back(std::move(face));
    }

    return faces;
}

} // namespace gymface

#endif // GYMFACE_DETECTORS_COMMON_H
