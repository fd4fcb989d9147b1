#include <vector/semantic_index.hpp>
#include <utils/logger.hpp>
#include <stdexcept>

namespace WikiCorpus {

SemanticIndex::SemanticIndex(EmbeddingStore& store, EmbeddingFunction embed)
    : store_(store), embed_(std::move(embed)) {
    if (!embed_) {
        throw std::invalid_argument("SemanticIndex requires an embedding function");
    }
}

void SemanticIndex::index(const std::string& key, const std::string& text) {
    store_.put(key, embed_(text));
}

std::vector<ScoredKey> SemanticIndex::search(const std::string& text, size_t k) {
    return store_.find_similar(embed_(text), k);
}

size_t SemanticIndex::index_articles(std::span<const Article> articles) {
    size_t written = 0;
    for (const auto& article : articles) {
        if (article.is_redirect) continue;
        index(article.title, article.title + "\n" + article.content);
        ++written;
    }
    Logger::info("Indexed " + std::to_string(written) + " embeddings into section " + store_.section());
    return written;
}

} // namespace WikiCorpus
