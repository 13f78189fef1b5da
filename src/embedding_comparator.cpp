#include "embedding_comparator.h"
#include "errors.h"
#include "logger.h"
#include <cmath>
#include <numeric>
#include <sstream>

namespace gymface {

EmbeddingComparator::EmbeddingComparator(size_t dimensions, double default_tolerance)
    : dimensions_(dimensions), default_tolerance_(default_tolerance) {
}

void EmbeddingComparator::validate(const Embedding& embedding) const {
    if (embedding.size() != dimensions_) {
        throw FaceError(ErrorKind::InputValidation,
            "Expected " + std::to_string(dimensions_) + "-dimensional embedding, got " +
            std::to_string(embedding.size()) + " dimensions");
    }
    for (double v : embedding) {
        if (!std::isfinite(v)) {
            throw FaceError(ErrorKind::InputValidation, "Embedding contains non-finite values");
        }
    }
}

ComparisonResult EmbeddingComparator::compare(const Embedding& a, const Embedding& b,
                                              std::optional<double> tolerance) const {
    validate(a);
    validate(b);

    const double t = tolerance.value_or(default_tolerance_);

    ComparisonResult result;
    result.similarity = std::inner_product(a.begin(), a.end(), b.begin(), 0.0);
    result.is_match = result.similarity >= t;

    std::ostringstream ss;
    ss << "Embedding comparison: similarity=" << result.similarity
       << ", tolerance=" << t << ", match=" << (result.is_match ? "true" : "false");
    Logger::getInstance().debug(ss.str());

    return result;
}

BestMatch EmbeddingComparator::findBestMatch(const Embedding& query, const std::vector<Embedding>& candidates,
                                             std::optional<double> tolerance) const {
    validate(query);
    const double t = tolerance.value_or(default_tolerance_);

    BestMatch best;
    size_t best_index = 0;
    bool seen = false;

    for (size_t i = 0; i < candidates.size(); i++) {
        const Embedding& candidate = candidates[i];
        if (candidate.size() != dimensions_) {
            Logger::getInstance().warning("Skipping candidate " + std::to_string(i) + " with " +
                std::to_string(candidate.size()) + " dimensions");
            continue;
        }

        double similarity = std::inner_product(query.begin(), query.end(), candidate.begin(), 0.0);
        if (!seen || similarity > best.similarity) {
            best.similarity = similarity;
            best_index = i;
            seen = true;
        }
    }

    if (seen && best.similarity >= t) {
        best.index = best_index;
    }

    return best;
}

} // namespace gymface
