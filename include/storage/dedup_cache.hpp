#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>

namespace WikiCorpus {

/**
 * @brief Natural key -> row id cache for categories and images.
 *
 * Owned by exactly one writer. Ids learned inside an open transaction stay
 * pending until commit(); discard() forgets them after a rollback so the
 * cache never hands out an id for a row that was never persisted.
 */
class DedupCache {
public:
    using Id = int64_t;

    DedupCache() = default;

    DedupCache(const DedupCache&) = delete;
    DedupCache& operator=(const DedupCache&) = delete;
    DedupCache(DedupCache&&) = default;
    DedupCache& operator=(DedupCache&&) = default;

    std::optional<Id> find_category(const std::string& name) const {
        return find(categories_, pending_categories_, name);
    }

    void add_category(const std::string& name, Id id) {
        pending_categories_[name] = id;
    }

    std::optional<Id> find_image(const std::string& hash) const {
        return find(images_, pending_images_, hash);
    }

    void add_image(const std::string& hash, Id id) {
        pending_images_[hash] = id;
    }

    /**
     * @brief Promote pending entries once their transaction has committed.
     */
    void commit() {
        categories_.merge(pending_categories_);
        images_.merge(pending_images_);
        pending_categories_.clear();
        pending_images_.clear();
    }

    /**
     * @brief Forget pending entries after a rollback.
     */
    void discard() {
        pending_categories_.clear();
        pending_images_.clear();
    }

    void clear() {
        discard();
        categories_.clear();
        images_.clear();
    }

    size_t category_count() const { return categories_.size(); }
    size_t image_count() const { return images_.size(); }
    size_t pending_count() const { return pending_categories_.size() + pending_images_.size(); }

private:
    using Map = std::unordered_map<std::string, Id>;

    static std::optional<Id> find(const Map& committed, const Map& pending, const std::string& key) {
        if (auto it = committed.find(key); it != committed.end()) return it->second;
        if (auto it = pending.find(key); it != pending.end()) return it->second;
        return std::nullopt;
    }

    Map categories_;
    Map images_;
    Map pending_categories_;
    Map pending_images_;
};

} // namespace WikiCorpus
