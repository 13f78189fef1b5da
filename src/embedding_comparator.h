#ifndef GYMFACE_EMBEDDING_COMPARATOR_H
#define GYMFACE_EMBEDDING_COMPARATOR_H

#include "face_model.h"
#include <optional>
#include <vector>

namespace gymface {

struct ComparisonResult {
    bool is_match = false;
    double similarity = 0.0;  // [-1, 1]; 1.0 = identical
};

struct BestMatch {
    std::optional<size_t> index;  // nullopt when nothing reaches the tolerance
    double similarity = -1.0;     // best similarity seen, even without a match
};

// Cosine similarity between unit-norm embeddings.
// Inputs are not renormalized: the extractor guarantees unit L2 norm.
class EmbeddingComparator {
public:
    EmbeddingComparator(size_t dimensions, double default_tolerance);

    // FaceError(InputValidation) on a length mismatch or non-finite values
    ComparisonResult compare(const Embedding& a, const Embedding& b,
                             std::optional<double> tolerance = std::nullopt) const;

    // Linear scan over every candidate. Fine for a single gym's roster;
    // an approximate nearest-neighbor index belongs here if candidate counts grow.
    BestMatch findBestMatch(const Embedding& query, const std::vector<Embedding>& candidates,
                            std::optional<double> tolerance = std::nullopt) const;

    void validate(const Embedding& embedding) const;

    size_t dimensions() const { return dimensions_; }
    double defaultTolerance() const { return default_tolerance_; }

private:
    size_t dimensions_;
    double default_tolerance_;
};

} // namespace gymface

#endif // GYMFACE_EMBEDDING_COMPARATOR_H
