// SCRFD Face Detector
// Model: SCRFD (Sample and Computation Redistribution Face Detector) with keypoint head
// Input: "input.1", RGB, mean 127.5, norm 1/128, letterboxed to a multiple of 32
// Output per stride (8/16/32), 2 anchors per location:
//         - score_*: classification scores
//         - bbox_*:  distance-transform box offsets (multiplied by stride)
//         - kps_*:   5 keypoint offsets (multiplied by stride)
// Reference: https://github.com/nihui/ncnn-android-scrfd

#include "detectors.h"
#include "../logger.h"
#include <ncnn/net.h>
#include <vector>
#include <cmath>

namespace gymface {

namespace {

struct StrideBlobs {
    int feat_stride;
    int base_size;
    const char* score;
    const char* bbox;
    const char* kps;
    // numbered blob names used by the optimized (pnnx) exports
    const char* score_alt;
    const char* bbox_alt;
};

const StrideBlobs kStrides[] = {
    {8,  16,  "score_8",  "bbox_8",  "kps_8",  "412", "415"},
    {16, 64,  "score_16", "bbox_16", "kps_16", "474", "477"},
    {32, 256, "score_32", "bbox_32", "kps_32", "536", "539"},
};

bool extractBlob(ncnn::Extractor& ex, const char* name, const char* alt, ncnn::Mat& out) {
    if (ex.extract(name, out) == 0) {
        return true;
    }
    return alt != nullptr && ex.extract(alt, out) == 0;
}

void generateProposals(const ncnn::Mat& anchors, int feat_stride,
                       const ncnn::Mat& score_blob, const ncnn::Mat& bbox_blob, const ncnn::Mat& kps_blob,
                       float prob_threshold, std::vector<FaceObject>& faceobjects) {
    const int w = score_blob.w;
    const int h = score_blob.h;
    const int num_anchors = anchors.h;
    const bool has_kps = !kps_blob.empty();

    for (int q = 0; q < num_anchors; q++) {
        const float* anchor = anchors.row(q);

        const ncnn::Mat score = score_blob.channel(q);
        const ncnn::Mat bbox = bbox_blob.channel_range(q * 4, 4);
        ncnn::Mat kps;
        if (has_kps) {
            kps = kps_blob.channel_range(q * 10, 10);
        }

        float anchor_y = anchor[1];
        const float anchor_w = anchor[2] - anchor[0];
        const float anchor_h = anchor[3] - anchor[1];

        for (int i = 0; i < h; i++) {
            float anchor_x = anchor[0];

            for (int j = 0; j < w; j++) {
                const int index = i * w + j;
                const float prob = score[index];

                if (prob >= prob_threshold) {
                    const float cx = anchor_x + anchor_w * 0.5f;
                    const float cy = anchor_y + anchor_h * 0.5f;

                    // distance2bbox: center +/- distance
                    const float x0 = cx - bbox.channel(0)[index] * feat_stride;
                    const float y0 = cy - bbox.channel(1)[index] * feat_stride;
                    const float x1 = cx + bbox.channel(2)[index] * feat_stride;
                    const float y1 = cy + bbox.channel(3)[index] * feat_stride;

                    FaceObject obj;
                    obj.x = x0;
                    obj.y = y0;
                    obj.width = x1 - x0 + 1;
                    obj.height = y1 - y0 + 1;
                    obj.prob = prob;

                    if (has_kps) {
                        for (int k = 0; k < 5; k++) {
                            obj.landmarks.emplace_back(
                                cx + kps.channel(k * 2)[index] * feat_stride,
                                cy + kps.channel(k * 2 + 1)[index] * feat_stride);
                        }
                    }

                    faceobjects.push_back(std::move(obj));
                }

                anchor_x += feat_stride;
            }

            anchor_y += feat_stride;
        }
    }
}

} // namespace

std::vector<FaceObject> detectWithSCRFD(const ncnn::Net& net, const ncnn::Mat& in,
                                        const Letterbox& box, float confidence_threshold) {
    ncnn::Extractor ex = net.create_extractor();
    ex.set_light_mode(true);
    ex.input("input.1", in);

    const float nms_threshold = 0.45f;

    // ratio 1.0, scales [1, 2]
    ncnn::Mat ratios(1);
    ratios[0] = 1.f;
    ncnn::Mat scales(2);
    scales[0] = 1.f;
    scales[1] = 2.f;

    std::vector<FaceObject> proposals;
    bool any_kps = false;

    for (const StrideBlobs& s : kStrides) {
        ncnn::Mat score_blob, bbox_blob, kps_blob;
        if (!extractBlob(ex, s.score, s.score_alt, score_blob) ||
            !extractBlob(ex, s.bbox, s.bbox_alt, bbox_blob)) {
            Logger::getInstance().error("SCRFD: missing output blobs for stride " + std::to_string(s.feat_stride));
            continue;
        }
        if (ex.extract(s.kps, kps_blob) == 0) {
            any_kps = true;
        } else {
            kps_blob = ncnn::Mat();
        }

        ncnn::Mat anchors = generate_anchors(s.base_size, ratios, scales, true);
        generateProposals(anchors, s.feat_stride, score_blob, bbox_blob, kps_blob,
                          confidence_threshold, proposals);
    }

    if (!any_kps) {
        Logger::getInstance().debug("SCRFD model has no keypoint head; landmarks unavailable");
    }

    qsort_descent_inplace(proposals);
    std::vector<int> picked;
    nms_sorted_bboxes(proposals, picked, nms_threshold);

    return restore_to_image(proposals, picked, box.scale, box.wpad, box.hpad, box.orig_w, box.orig_h);
}

} // namespace gymface
