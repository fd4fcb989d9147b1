/**
 * @file similarity.cpp
 * @brief Cosine similarity via Eigen
 */

#include <vector/similarity.hpp>
#include <utils/errors.hpp>
#include <Eigen/Core>
#include <algorithm>
#include <cmath>

namespace WikiCorpus {

float cosine_similarity(std::span<const float> a, std::span<const float> b) {
    if (a.size() != b.size()) {
        throw DimensionMismatchError(a.size(), b.size(), "cosine similarity");
    }
    if (a.empty()) return 0.0f;

    Eigen::Map<const Eigen::VectorXf> va(a.data(), static_cast<Eigen::Index>(a.size()));
    Eigen::Map<const Eigen::VectorXf> vb(b.data(), static_cast<Eigen::Index>(b.size()));

    // Accumulate in double: 1536-dimensional float dot products lose several digits otherwise
    const Eigen::VectorXd da = va.cast<double>();
    const Eigen::VectorXd db = vb.cast<double>();

    const double na = da.norm();
    const double nb = db.norm();
    if (!(na > 0.0) || !(nb > 0.0)) return 0.0f;

    double cos = da.dot(db) / (na * nb);
    if (std::isnan(cos)) return 0.0f;
    return static_cast<float>(std::clamp(cos, -1.0, 1.0));
}

std::vector<ScoredKey> rank_top_k(std::vector<ScoredKey> scored, size_t k) {
    const auto by_score = [](const ScoredKey& x, const ScoredKey& y) { return x.score > y.score; };

    if (k < scored.size()) {
        std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(k), scored.end(), by_score);
        scored.resize(k);
    } else {
        std::sort(scored.begin(), scored.end(), by_score);
    }
    return scored;
}

void TopK::push(std::string key, float score) {
    if (k_ == 0) return;
    if (heap_.size() < k_) {
        heap_.push({std::move(key), score});
    } else if (score > heap_.top().score) {
        heap_.pop();
        heap_.push({std::move(key), score});
    }
}

std::vector<ScoredKey> TopK::take() {
    std::vector<ScoredKey> out(heap_.size());
    for (size_t i = out.size(); i-- > 0;) {
        out[i] = heap_.top();
        heap_.pop();
    }
    return out;
}

} // namespace WikiCorpus
