// RetinaFace Face Detector
// Model: RetinaFace (mnet.25-opt)
// Input: "data", raw RGB (no normalization)
// Output per stride (32/16/8), 2 anchors per location:
//         - face_rpn_cls_prob_reshape_stride*: classification scores
//         - face_rpn_bbox_pred_stride*: box deltas
//         - face_rpn_landmark_pred_stride*: 5 landmark deltas
// Reference: https://github.com/deepinsight/insightface/tree/master/detection/retinaface

#include "detectors.h"
#include "../logger.h"
#include <ncnn/net.h>
#include <string>
#include <vector>
#include <cmath>

namespace gymface {

namespace {

void generateProposals(const ncnn::Mat& anchors, int feat_stride,
                       const ncnn::Mat& score_blob, const ncnn::Mat& bbox_blob, const ncnn::Mat& landmark_blob,
                       float prob_threshold, std::vector<FaceObject>& faceobjects) {
    const int w = score_blob.w;
    const int h = score_blob.h;
    const int num_anchors = anchors.h;
    const bool has_landmarks = !landmark_blob.empty();

    for (int q = 0; q < num_anchors; q++) {
        const float* anchor = anchors.row(q);
        // first num_anchors channels are background scores
        const ncnn::Mat score = score_blob.channel(q + num_anchors);
        const ncnn::Mat bbox = bbox_blob.channel_range(q * 4, 4);
        ncnn::Mat landmark;
        if (has_landmarks) {
            landmark = landmark_blob.channel_range(q * 10, 10);
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

                    const float pb_cx = cx + anchor_w * bbox.channel(0)[index];
                    const float pb_cy = cy + anchor_h * bbox.channel(1)[index];
                    const float pb_w = anchor_w * std::exp(bbox.channel(2)[index]);
                    const float pb_h = anchor_h * std::exp(bbox.channel(3)[index]);

                    FaceObject obj;
                    obj.x = pb_cx - pb_w * 0.5f;
                    obj.y = pb_cy - pb_h * 0.5f;
                    obj.width = pb_w;
                    obj.height = pb_h;
                    obj.prob = prob;

                    if (has_landmarks) {
                        for (int k = 0; k < 5; k++) {
                            obj.landmarks.emplace_back(
                                cx + (anchor_w + 1) * landmark.channel(k * 2)[index],
                                cy + (anchor_h + 1) * landmark.channel(k * 2 + 1)[index]);
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

std::vector<FaceObject> detectWithRetinaFace(const ncnn::Net& net, const ncnn::Mat& in,
                                             const Letterbox& box, float confidence_threshold) {
    ncnn::Extractor ex = net.create_extractor();
    ex.set_light_mode(true);
    ex.input("data", in);

    const float nms_threshold = 0.4f;

    struct Level {
        int feat_stride;
        float scale_a;
        float scale_b;
    };
    const Level levels[] = {
        {32, 32.f, 16.f},
        {16, 8.f, 4.f},
        {8, 2.f, 1.f},
    };

    std::vector<FaceObject> proposals;

    for (const Level& level : levels) {
        const std::string suffix = "_stride" + std::to_string(level.feat_stride);
        ncnn::Mat score_blob, bbox_blob, landmark_blob;

        if (ex.extract(("face_rpn_cls_prob_reshape" + suffix).c_str(), score_blob) != 0 ||
            ex.extract(("face_rpn_bbox_pred" + suffix).c_str(), bbox_blob) != 0) {
            Logger::getInstance().error("RetinaFace: missing output blobs for stride " +
                std::to_string(level.feat_stride));
            continue;
        }
        if (ex.extract(("face_rpn_landmark_pred" + suffix).c_str(), landmark_blob) != 0) {
            landmark_blob = ncnn::Mat();
        }

        ncnn::Mat ratios(1);
        ratios[0] = 1.f;
        ncnn::Mat scales(2);
        scales[0] = level.scale_a;
        scales[1] = level.scale_b;
        ncnn::Mat anchors = generate_anchors(16, ratios, scales, false);

        generateProposals(anchors, level.feat_stride, score_blob, bbox_blob, landmark_blob,
                          confidence_threshold, proposals);
    }

    qsort_descent_inplace(proposals);
    std::vector<int> picked;
    nms_sorted_bboxes(proposals, picked, nms_threshold);

    return restore_to_image(proposals, picked, box.scale, box.wpad, box.hpad, box.orig_w, box.orig_h);
}

} // namespace gymface
