#ifndef GYMFACE_ENCODING_CONFIG_H
#define GYMFACE_ENCODING_CONFIG_H

#include <cstddef>

namespace gymface {

// ============================================================================
// FACE EMBEDDING FORMAT
// ============================================================================
// Embeddings are unit-L2-norm vectors of 64-bit floats. The dimension is
// configurable ([recognition] embedding_dimensions) and must match the
// recognition model's output layer; every stored record is tagged with the
// version string below so a model swap can be detected later.
// ============================================================================
constexpr size_t FACE_ENCODING_DIM = 512;

constexpr const char* FACE_ENCODING_VERSION = "ncnn_arcface_v1_vector";
constexpr const char* THUMBNAIL_ENCRYPTION_SCHEME = "AES-256-GCM";

} // namespace gymface

#endif // GYMFACE_ENCODING_CONFIG_H
