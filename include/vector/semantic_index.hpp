/**
 * @file semantic_index.hpp
 * @brief Text-level indexing and search over an EmbeddingStore
 */

#pragma once

#include <parser/article.hpp>
#include <vector/embedding_store.hpp>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace WikiCorpus {

/**
 * @brief Maps text to a fixed-dimension vector. Supplied by the caller.
 */
using EmbeddingFunction = std::function<std::vector<float>(const std::string&)>;

/**
 * @brief Couples an EmbeddingStore with an embedder.
 *
 * Exceptions thrown by the embedder propagate unchanged. The corpus tables and
 * the embedding section are not updated together; readers must tolerate
 * vectors for titles that no longer exist and titles without vectors.
 */
class SemanticIndex {
public:
    SemanticIndex(EmbeddingStore& store, EmbeddingFunction embed);

    void index(const std::string& key, const std::string& text);

    std::vector<ScoredKey> search(const std::string& text, size_t k);

    /**
     * @brief Embed title + "\n" + content for every non-redirect article.
     * @return Number of vectors written
     */
    size_t index_articles(std::span<const Article> articles);

private:
    EmbeddingStore& store_;
    EmbeddingFunction embed_;
};

} // namespace WikiCorpus
