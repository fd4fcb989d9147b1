/**
 * @file markup_reader.hpp
 * @brief Incremental XML-subset tokenizer pushing events to a handler
 */

#pragma once

#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace WikiCorpus {

using Attributes = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Receiver of markup events, in document order.
 *
 * A self-closing element produces on_start_element(..., true) immediately
 * followed by on_end_element. Text may arrive split across several calls.
 */
class MarkupHandler {
public:
    virtual ~MarkupHandler() = default;

    virtual void on_start_element(const std::string& name, const Attributes& attrs, bool self_closing) = 0;
    virtual void on_end_element(const std::string& name) = 0;
    virtual void on_text(std::string_view text) = 0;
    virtual void on_end_of_stream() = 0;
};

/**
 * @brief Streaming tokenizer over a byte stream.
 *
 * Reads through the stream's buffer one character at a time and never holds
 * more than the current tag and a bounded piece of text. Enforces one root
 * element and balanced nesting; any violation raises StreamError.
 *
 * Not thread-safe; one reader per stream.
 */
class MarkupReader {
public:
    static constexpr size_t TEXT_CHUNK = 64 * 1024;

    MarkupReader(std::istream& in, MarkupHandler& handler);

    /**
     * @brief Drain the stream, dispatching every event to the handler.
     */
    void run();

    size_t line() const { return line_; }
    size_t column() const { return column_; }

private:
    int get();
    int peek();
    [[noreturn]] void fail(const std::string& msg) const;

    void read_markup();
    void read_start_tag(int first);
    void read_end_tag();
    void read_comment();
    void read_cdata();
    void read_declaration();
    void read_processing_instruction();

    std::string read_name(int first);
    void skip_spaces();
    void append_entity(std::string& out);

    void flush_text();
    void text_char(char c);

    std::streambuf* buf_;
    MarkupHandler& handler_;

    std::vector<std::string> open_;
    bool root_seen_ = false;
    std::string text_;
    bool text_has_content_ = false;

    size_t line_ = 1;
    size_t column_ = 0;
};

} // namespace WikiCorpus
