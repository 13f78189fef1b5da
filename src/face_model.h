#ifndef GYMFACE_FACE_MODEL_H
#define GYMFACE_FACE_MODEL_H

#include "image.h"
#include <optional>
#include <string>
#include <vector>

namespace gymface {

using Embedding = std::vector<double>;

// Categorical codes produced by the gender/age head
enum class Gender {
    Female = 0,
    Male = 1
};

inline const char* genderCode(Gender g) {
    return g == Gender::Male ? "M" : "F";
}

// One detected face. Produced per extraction call, consumed immediately, never cached.
struct FaceDetection {
    Rect bbox;
    std::vector<Point> landmarks;  // left eye, right eye, nose, left mouth, right mouth
    float confidence = 0.0f;
    std::optional<int> age;
    std::optional<Gender> gender;
    Embedding embedding;           // unit L2 norm
};

// Face detection + embedding capability.
// Implementations must tolerate concurrent detect() calls from several threads.
class FaceModel {
public:
    virtual ~FaceModel() = default;

    // Every face in a 3-channel BGR image, each with its embedding; throws on inference failure
    virtual std::vector<FaceDetection> detect(const ImageView& image) const = 0;

    virtual size_t embeddingDimension() const = 0;
    virtual std::string modelName() const = 0;
};

} // namespace gymface

#endif // GYMFACE_FACE_MODEL_H
