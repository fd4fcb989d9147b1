/**
 * @file wikitext.hpp
 * @brief Stateless wikitext transforms used to finish each parsed record
 *
 * Every function is total: malformed or unbalanced markup degrades to
 * "no match" and is left in place, nothing throws.
 */

#pragma once

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace WikiCorpus {

class WikitextExtractor {
public:
    struct ImageMarkup {
        std::string filename;
        std::optional<std::string> options;  // everything after the first '|'
    };

    /**
     * @brief Remove {{...}} invocations in one left-to-right pass.
     *
     * Not recursive: in "{{a {{b}} c}}" the span "{{a {{b}}" is removed and
     * " c}}" survives.
     */
    static std::string strip_templates(const std::string& text);

    /**
     * @brief Replace [[target|display]] and [url display] with their display text.
     *
     * Falls back to the target (or URL) when no display text is given.
     */
    static std::string resolve_links(const std::string& text);

    /**
     * @brief Remove <...> delimiters, keeping the text between tags.
     */
    static std::string strip_tags(const std::string& text);

    /**
     * @brief Collapse runs of blank lines into a single blank line.
     */
    static std::string collapse_blank_lines(const std::string& text);

    /**
     * @brief Full cleaning pipeline: templates, links, tags, blank lines, trim.
     */
    static std::string clean(const std::string& text);

    /**
     * @brief Target of a "#REDIRECT [[Target]]" line (keyword case-insensitive).
     */
    static std::optional<std::string> extract_redirect_target(const std::string& text);

    /**
     * @brief Names of [[Category:Name|sort key]] links, sort keys dropped.
     */
    static std::set<std::string> extract_categories(const std::string& text);

    /**
     * @brief [[File:...]] and [[Image:...]] references in document order.
     */
    static std::vector<ImageMarkup> extract_image_references(const std::string& text);

    /**
     * @brief Caption from an image option string: the last option unless it is
     * a layout keyword (thumb, left, 200px, alt=..., ...).
     */
    static std::optional<std::string> image_caption(const std::optional<std::string>& options);
};

} // namespace WikiCorpus
