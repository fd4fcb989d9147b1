/**
 * @file article.hpp
 * @brief Records produced by the dump parser and consumed by the corpus writer
 */

#pragma once

#include <utils/time.hpp>
#include <cstddef>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace WikiCorpus {

// MediaWiki refuses titles longer than 255 bytes
inline constexpr size_t k_max_title_bytes = 255;

/**
 * @brief Reference to an image used by an article.
 *
 * `hash` is the deduplication key: two references with the same hash are the
 * same stored object regardless of filename or caption.
 */
struct ImageRef {
    std::string filename;
    std::string path;
    size_t size = 0;
    std::string mime_type;
    std::string hash;
    std::optional<std::string> caption;

    /**
     * @brief Build a reference from wikitext markup (file bytes are not available).
     *
     * The hash is derived from the canonical file name so that every mention of
     * the same file collapses onto one stored row.
     */
    static ImageRef from_markup(const std::string& filename, std::optional<std::string> caption);

    /**
     * @brief Build a reference for a file whose bytes are known.
     */
    static ImageRef from_bytes(const std::string& filename, const std::string& bytes,
                               std::optional<std::string> caption = std::nullopt);
};

/**
 * @brief One parsed encyclopedia article. Immutable once emitted by the parser.
 */
struct Article {
    std::string title;
    std::string content;
    size_t size = 0;
    TimePoint last_modified{};
    bool is_redirect = false;
    std::optional<std::string> redirect_target;
    std::set<std::string> categories;
    std::vector<ImageRef> images;
};

/**
 * @brief Metadata announced by a dump's <siteinfo> block.
 */
struct DumpMetadata {
    std::string site_name;
    std::string db_name;
    std::string generator;
    std::string language;
    size_t article_count = 0;
};

/**
 * @brief Throws ValidationError if the article breaks a field invariant.
 */
void validate_article(const Article& article);

/**
 * @brief MediaWiki canonical form: first letter upper-cased, spaces as underscores.
 */
std::string canonical_file_name(const std::string& filename);

/**
 * @brief MIME type from the file extension, "image/unknown" when unrecognised.
 */
std::string mime_type_for(const std::string& filename);

} // namespace WikiCorpus
