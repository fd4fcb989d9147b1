/**
 * @file dump_stream_parser.hpp
 * @brief Push-style state machine turning markup events into Articles
 */

#pragma once

#include <parser/article.hpp>
#include <parser/markup_reader.hpp>
#include <utils/errors.hpp>
#include <functional>
#include <istream>
#include <optional>
#include <string>

namespace WikiCorpus {

/**
 * @brief Streaming parser for encyclopedia dumps.
 *
 * Expected shape: one root element holding repeated document elements
 * (<page> or <doc>), each with a <title>, an optional self-closing
 * <redirect title="..."/>, and a <text> body of raw wikitext. MediaWiki
 * bookkeeping (<revision>, <ns>, <id>, <contributor>, ...) is tolerated and
 * <siteinfo> is captured as metadata. Anything else is a StreamError.
 *
 * Only the document currently being read is held in memory. A document is
 * handed to the sink only once its closing tag has been seen.
 */
class DumpStreamParser : public MarkupHandler {
public:
    enum class State {
        Idle,
        InDocument,
        InTitle,
        InBody,
        InRedirectTag,
        InTimestamp,
        InSkipped,
        InSiteInfo
    };

    using ArticleSink = std::function<void(Article&&)>;
    using InvalidRecordHandler = std::function<void(const ValidationError&)>;

    /**
     * @param sink Receives every complete, valid article
     * @param on_invalid Receives per-record validation failures. When empty,
     *        the first invalid record aborts the parse with ValidationError.
     */
    explicit DumpStreamParser(ArticleSink sink, InvalidRecordHandler on_invalid = nullptr);

    /**
     * @brief Parse a whole stream.
     * @return Number of articles handed to the sink
     */
    size_t parse(std::istream& in);

    size_t parse_file(const std::string& path);

    const DumpMetadata& metadata() const { return metadata_; }
    State state() const { return state_; }
    size_t article_count() const { return count_; }

    // MarkupHandler
    void on_start_element(const std::string& name, const Attributes& attrs, bool self_closing) override;
    void on_end_element(const std::string& name) override;
    void on_text(std::string_view text) override;
    void on_end_of_stream() override;

private:
    [[noreturn]] void fail(const std::string& msg) const;

    void reset();
    void begin_document();
    void finish_body();
    void finish_document();

    void start_in_document(const std::string& name, const Attributes& attrs);

    ArticleSink sink_;
    InvalidRecordHandler on_invalid_;
    const MarkupReader* reader_ = nullptr;

    State state_ = State::Idle;
    size_t depth_ = 0;
    bool root_open_ = false;
    bool in_revision_ = false;
    size_t nested_depth_ = 0;  // depth of the InSkipped/InSiteInfo element

    // Per-document accumulator
    std::string title_;
    std::string body_;
    std::string timestamp_;
    std::optional<std::string> marker_target_;
    std::optional<std::string> body_redirect_;
    std::string content_;
    std::set<std::string> categories_;
    std::vector<ImageRef> images_;

    std::string site_field_;
    std::string site_text_;

    DumpMetadata metadata_;
    size_t count_ = 0;
};

} // namespace WikiCorpus
