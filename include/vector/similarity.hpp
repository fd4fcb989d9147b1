/**
 * @file similarity.hpp
 * @brief Cosine similarity and top-k ranking
 */

#pragma once

#include <cstddef>
#include <queue>
#include <span>
#include <string>
#include <vector>

namespace WikiCorpus {

struct ScoredKey {
    std::string key;
    float score = 0.0f;
};

/**
 * @brief dot(a, b) / (|a| * |b|), in [-1, 1].
 *
 * A zero vector or a NaN anywhere yields 0 instead of an error.
 * @throws DimensionMismatchError if a.size() != b.size()
 */
float cosine_similarity(std::span<const float> a, std::span<const float> b);

/**
 * @brief The k highest scores, descending. Order among equal scores is unspecified.
 */
std::vector<ScoredKey> rank_top_k(std::vector<ScoredKey> scored, size_t k);

/**
 * @brief Streaming top-k: holds at most k candidates while a scan runs.
 */
class TopK {
public:
    explicit TopK(size_t k) : k_(k) {}

    void push(std::string key, float score);

    /**
     * @brief Drain into a descending list. The accumulator is empty afterwards.
     */
    std::vector<ScoredKey> take();

    size_t size() const { return heap_.size(); }

private:
    struct Worse {
        bool operator()(const ScoredKey& a, const ScoredKey& b) const { return a.score > b.score; }
    };

    size_t k_;
    // Min-heap: top() is the weakest candidate kept so far
    std::priority_queue<ScoredKey, std::vector<ScoredKey>, Worse> heap_;
};

} // namespace WikiCorpus
