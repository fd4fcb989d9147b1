#include <parser/dump_stream_parser.hpp>
#include <parser/wikitext.hpp>
#include <utils/logger.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <fstream>
#include <unordered_set>

namespace WikiCorpus {

namespace {

bool is_document_element(const std::string& name) {
    return name == "page" || name == "doc";
}

// MediaWiki per-page bookkeeping whose content is not part of an Article
bool is_ignored_element(const std::string& name) {
    static const std::unordered_set<std::string> ignored = {
        "ns", "id", "parentid", "contributor", "comment", "model", "format",
        "sha1", "minor", "origin", "restrictions", "username", "ip",
        "discussionthreadinginfo"
    };
    return ignored.count(name) > 0;
}

bool all_space(std::string_view text) {
    return std::all_of(text.begin(), text.end(), [](char c) { return is_space(c); });
}

} // namespace

DumpStreamParser::DumpStreamParser(ArticleSink sink, InvalidRecordHandler on_invalid)
    : sink_(std::move(sink)), on_invalid_(std::move(on_invalid)) {
    if (!sink_) {
        throw std::invalid_argument("DumpStreamParser requires an article sink");
    }
}

void DumpStreamParser::fail(const std::string& msg) const {
    if (reader_) throw StreamError(msg, reader_->line(), reader_->column());
    throw StreamError(msg);
}

size_t DumpStreamParser::parse(std::istream& in) {
    reset();
    count_ = 0;
    metadata_ = DumpMetadata{};

    MarkupReader reader(in, *this);
    reader_ = &reader;
    try {
        reader.run();
    } catch (...) {
        reader_ = nullptr;
        throw;
    }
    reader_ = nullptr;

    metadata_.article_count = count_;
    Logger::info("Finished processing " + std::to_string(count_) + " articles");
    return count_;
}

size_t DumpStreamParser::parse_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw StreamError("Failed to open dump file: " + path);
    }
    Logger::step("Parsing " + path);
    return parse(in);
}

void DumpStreamParser::reset() {
    state_ = State::Idle;
    depth_ = 0;
    root_open_ = false;
    in_revision_ = false;
    nested_depth_ = 0;
    begin_document();
}

void DumpStreamParser::begin_document() {
    title_.clear();
    body_.clear();
    timestamp_.clear();
    marker_target_.reset();
    body_redirect_.reset();
    content_.clear();
    categories_.clear();
    images_.clear();
    in_revision_ = false;
}

void DumpStreamParser::on_start_element(const std::string& name, const Attributes& attrs, bool /*self_closing*/) {
    ++depth_;

    switch (state_) {
        case State::Idle:
            if (!root_open_) {
                root_open_ = true;
                for (const auto& [key, value] : attrs) {
                    if (key == "xml:lang") metadata_.language = value;
                }
                return;
            }
            if (is_document_element(name)) {
                begin_document();
                state_ = State::InDocument;
                return;
            }
            if (name == "siteinfo") {
                state_ = State::InSiteInfo;
                nested_depth_ = depth_;
                return;
            }
            fail("Unexpected <" + name + "> at top level");

        case State::InDocument:
            start_in_document(name, attrs);
            return;

        case State::InSkipped:
            return;

        case State::InSiteInfo:
            if (depth_ == nested_depth_ + 1) {
                site_field_ = name;
                site_text_.clear();
            }
            return;

        case State::InTitle:
        case State::InBody:
        case State::InRedirectTag:
        case State::InTimestamp:
            fail("Unexpected <" + name + "> inside a document field");
    }
}

void DumpStreamParser::start_in_document(const std::string& name, const Attributes& attrs) {
    if (name == "title") {
        if (!title_.empty()) fail("Duplicate <title> in document");
        state_ = State::InTitle;
    } else if (name == "redirect") {
        auto it = std::find_if(attrs.begin(), attrs.end(),
                               [](const auto& a) { return a.first == "title"; });
        if (it == attrs.end() || trim(it->second).empty()) {
            fail("<redirect> without a title attribute");
        }
        marker_target_ = trim(it->second);
        state_ = State::InRedirectTag;
    } else if (name == "text") {
        // Full-history dumps repeat <text> per revision; the last one wins
        body_.clear();
        state_ = State::InBody;
    } else if (name == "revision") {
        if (in_revision_) fail("Nested <revision>");
        in_revision_ = true;
    } else if (name == "timestamp") {
        timestamp_.clear();
        state_ = State::InTimestamp;
    } else if (is_ignored_element(name)) {
        state_ = State::InSkipped;
        nested_depth_ = depth_;
    } else {
        fail("Unexpected <" + name + "> inside document");
    }
}

void DumpStreamParser::on_end_element(const std::string& name) {
    switch (state_) {
        case State::InTitle:
            state_ = State::InDocument;
            break;

        case State::InBody:
            finish_body();
            state_ = State::InDocument;
            break;

        case State::InRedirectTag:
        case State::InTimestamp:
            state_ = State::InDocument;
            break;

        case State::InSkipped:
            if (depth_ == nested_depth_) state_ = State::InDocument;
            break;

        case State::InSiteInfo:
            if (depth_ == nested_depth_) {
                state_ = State::Idle;
            } else if (depth_ == nested_depth_ + 1) {
                std::string value = trim(site_text_);
                if (site_field_ == "sitename") metadata_.site_name = value;
                else if (site_field_ == "dbname") metadata_.db_name = value;
                else if (site_field_ == "generator") metadata_.generator = value;
                else if (site_field_ == "lang") metadata_.language = value;
                site_field_.clear();
            }
            break;

        case State::InDocument:
            if (in_revision_ && name == "revision") {
                in_revision_ = false;
            } else if (is_document_element(name)) {
                finish_document();
                state_ = State::Idle;
            } else {
                fail("Unexpected </" + name + "> inside document");
            }
            break;

        case State::Idle:
            if (depth_ != 1) fail("Unexpected </" + name + "> at top level");
            root_open_ = false;
            break;
    }
    --depth_;
}

void DumpStreamParser::on_text(std::string_view text) {
    switch (state_) {
        case State::InTitle:
            title_.append(text);
            return;
        case State::InBody:
            body_.append(text);
            return;
        case State::InTimestamp:
            timestamp_.append(text);
            return;
        case State::InSiteInfo:
            if (!site_field_.empty() && depth_ == nested_depth_ + 1) site_text_.append(text);
            return;
        case State::InSkipped:
            return;
        case State::Idle:
        case State::InDocument:
        case State::InRedirectTag:
            if (!all_space(text)) fail("Unexpected text outside a document field");
            return;
    }
}

void DumpStreamParser::on_end_of_stream() {
    if (state_ != State::Idle || root_open_) {
        std::string where = title_.empty() ? std::string() : " '" + trim(title_) + "'";
        fail("End of stream inside an open document" + where);
    }
}

void DumpStreamParser::finish_body() {
    content_ = WikitextExtractor::clean(body_);
    body_redirect_ = WikitextExtractor::extract_redirect_target(body_);

    categories_.clear();
    images_.clear();
    if (!marker_target_ && !body_redirect_) {
        categories_ = WikitextExtractor::extract_categories(body_);
        for (const auto& ref : WikitextExtractor::extract_image_references(body_)) {
            images_.push_back(ImageRef::from_markup(ref.filename, WikitextExtractor::image_caption(ref.options)));
        }
    }

    body_.clear();
    body_.shrink_to_fit();
}

void DumpStreamParser::finish_document() {
    Article article;
    article.title = trim(title_);
    article.content = std::move(content_);
    article.size = article.content.size();
    article.last_modified = std::chrono::system_clock::now();

    if (!timestamp_.empty()) {
        if (auto ts = parse_iso8601(trim(timestamp_))) {
            article.last_modified = *ts;
        } else {
            Logger::warn("Ignoring malformed timestamp '" + trim(timestamp_) + "' on '" + article.title + "'");
        }
    }

    std::optional<std::string> target = marker_target_ ? marker_target_ : body_redirect_;
    if (target) {
        // Relations are never derived for redirects
        article.is_redirect = true;
        article.redirect_target = std::move(target);
    } else {
        article.categories = std::move(categories_);
        article.images = std::move(images_);
    }
    begin_document();

    try {
        validate_article(article);
    } catch (const ValidationError& e) {
        if (!on_invalid_) throw;
        on_invalid_(e);
        return;
    }

    sink_(std::move(article));
    ++count_;
    if (count_ % 1000 == 0) {
        Logger::info("Processed " + std::to_string(count_) + " articles");
    }
}

} // namespace WikiCorpus
