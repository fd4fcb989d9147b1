#include <parser/markup_reader.hpp>
#include <utils/errors.hpp>
#include <utils/unicode.hpp>
#include <cctype>

namespace WikiCorpus {

namespace {

bool is_name_start(int c) {
    return std::isalpha(c) || c == '_' || c == ':' || c >= 0x80;
}

bool is_name_char(int c) {
    return is_name_start(c) || std::isdigit(c) || c == '-' || c == '.';
}

} // namespace

MarkupReader::MarkupReader(std::istream& in, MarkupHandler& handler)
    : buf_(in.rdbuf()), handler_(handler) {
    if (!buf_) {
        throw StreamError("Input stream has no buffer");
    }
}

int MarkupReader::get() {
    int c = buf_->sbumpc();
    if (c == '\n') {
        ++line_;
        column_ = 0;
    } else if (c != std::char_traits<char>::eof()) {
        ++column_;
    }
    return c;
}

int MarkupReader::peek() {
    return buf_->sgetc();
}

void MarkupReader::fail(const std::string& msg) const {
    throw StreamError(msg, line_, column_);
}

void MarkupReader::run() {
    const int eof = std::char_traits<char>::eof();

    for (int c = get(); c != eof; c = get()) {
        if (c == '<') {
            flush_text();
            read_markup();
        } else if (c == '&') {
            std::string decoded;
            append_entity(decoded);
            for (char d : decoded) text_char(d);
        } else if (c == 0) {
            fail("NUL byte in stream");
        } else {
            text_char(static_cast<char>(c));
        }
    }

    flush_text();
    if (!open_.empty()) {
        fail("Unexpected end of stream inside <" + open_.back() + ">");
    }
    if (!root_seen_) {
        fail("Stream contains no root element");
    }
    handler_.on_end_of_stream();
}

void MarkupReader::text_char(char c) {
    if (open_.empty()) {
        if (!is_space(c)) {
            fail(root_seen_ ? "Text after the root element" : "Text before the root element");
        }
        return;
    }
    text_.push_back(c);
    if (text_.size() >= TEXT_CHUNK) flush_text();
}

void MarkupReader::flush_text() {
    if (text_.empty()) return;
    handler_.on_text(text_);
    text_.clear();
}

void MarkupReader::read_markup() {
    const int eof = std::char_traits<char>::eof();
    int c = get();
    if (c == eof) fail("Unterminated tag at end of stream");

    if (c == '/') {
        read_end_tag();
    } else if (c == '?') {
        read_processing_instruction();
    } else if (c == '!') {
        if (peek() == '-') {
            get();
            if (get() != '-') fail("Malformed comment");
            read_comment();
        } else if (peek() == '[') {
            get();
            for (const char* p = "CDATA["; *p; ++p) {
                if (get() != *p) fail("Malformed CDATA section");
            }
            read_cdata();
        } else {
            read_declaration();
        }
    } else if (is_name_start(c)) {
        read_start_tag(c);
    } else {
        fail("Malformed tag");
    }
}

std::string MarkupReader::read_name(int first) {
    std::string name(1, static_cast<char>(first));
    while (is_name_char(peek())) {
        name.push_back(static_cast<char>(get()));
    }
    return name;
}

void MarkupReader::skip_spaces() {
    while (peek() != std::char_traits<char>::eof() && is_space(static_cast<char>(peek()))) get();
}

void MarkupReader::read_start_tag(int first) {
    const int eof = std::char_traits<char>::eof();
    std::string name = read_name(first);

    if (open_.empty() && root_seen_) {
        fail("Element <" + name + "> after the root element");
    }

    Attributes attrs;
    bool self_closing = false;

    for (;;) {
        skip_spaces();
        int c = get();
        if (c == eof) fail("Unterminated start tag <" + name + ">");
        if (c == '>') break;
        if (c == '/') {
            if (get() != '>') fail("Malformed self-closing tag <" + name + ">");
            self_closing = true;
            break;
        }
        if (!is_name_start(c)) fail("Malformed attribute in <" + name + ">");

        std::string key = read_name(c);
        skip_spaces();
        if (get() != '=') fail("Attribute '" + key + "' in <" + name + "> has no value");
        skip_spaces();
        int quote = get();
        if (quote != '"' && quote != '\'') fail("Unquoted attribute '" + key + "' in <" + name + ">");

        std::string value;
        for (c = get(); c != quote; c = get()) {
            if (c == eof) fail("Unterminated attribute '" + key + "' in <" + name + ">");
            if (c == '<') fail("'<' inside attribute '" + key + "'");
            if (c == '&') append_entity(value);
            else value.push_back(static_cast<char>(c));
        }
        attrs.emplace_back(std::move(key), std::move(value));
    }

    root_seen_ = true;
    open_.push_back(name);
    handler_.on_start_element(name, attrs, self_closing);
    if (self_closing) {
        open_.pop_back();
        handler_.on_end_element(name);
    }
}

void MarkupReader::read_end_tag() {
    int c = get();
    if (!is_name_start(c)) fail("Malformed end tag");
    std::string name = read_name(c);
    skip_spaces();
    if (get() != '>') fail("Malformed end tag </" + name + ">");

    if (open_.empty()) {
        fail("Unexpected end tag </" + name + ">");
    }
    if (open_.back() != name) {
        fail("Mismatched end tag </" + name + ">, expected </" + open_.back() + ">");
    }
    open_.pop_back();
    handler_.on_end_element(name);
}

void MarkupReader::read_comment() {
    const int eof = std::char_traits<char>::eof();
    int dashes = 0;
    for (int c = get(); c != eof; c = get()) {
        if (c == '>' && dashes >= 2) return;
        dashes = (c == '-') ? dashes + 1 : 0;
    }
    fail("Unterminated comment");
}

void MarkupReader::read_cdata() {
    const int eof = std::char_traits<char>::eof();
    if (open_.empty()) fail("CDATA outside the root element");

    int brackets = 0;
    for (int c = get(); c != eof; c = get()) {
        if (c == '>' && brackets >= 2) {
            // Drop the two ']' that belong to the terminator
            text_.resize(text_.size() - 2);
            flush_text();
            return;
        }
        brackets = (c == ']') ? brackets + 1 : 0;
        text_.push_back(static_cast<char>(c));
    }
    fail("Unterminated CDATA section");
}

void MarkupReader::read_declaration() {
    const int eof = std::char_traits<char>::eof();
    if (root_seen_) fail("Declaration inside the document body");

    int depth = 0;
    for (int c = get(); c != eof; c = get()) {
        if (c == '[') ++depth;
        else if (c == ']') --depth;
        else if (c == '>' && depth <= 0) return;
    }
    fail("Unterminated declaration");
}

void MarkupReader::read_processing_instruction() {
    const int eof = std::char_traits<char>::eof();
    bool question = false;
    for (int c = get(); c != eof; c = get()) {
        if (c == '>' && question) return;
        question = (c == '?');
    }
    fail("Unterminated processing instruction");
}

void MarkupReader::append_entity(std::string& out) {
    const int eof = std::char_traits<char>::eof();
    std::string ref;
    for (int c = get(); c != ';'; c = get()) {
        if (c == eof || ref.size() > 10 || c == '<' || c == '&' || is_space(static_cast<char>(c))) {
            fail("Unterminated entity reference");
        }
        ref.push_back(static_cast<char>(c));
    }

    if (ref == "amp") { out.push_back('&'); return; }
    if (ref == "lt") { out.push_back('<'); return; }
    if (ref == "gt") { out.push_back('>'); return; }
    if (ref == "quot") { out.push_back('"'); return; }
    if (ref == "apos") { out.push_back('\''); return; }

    if (ref.size() > 1 && ref[0] == '#') {
        bool hex = (ref[1] == 'x' || ref[1] == 'X');
        std::string digits = ref.substr(hex ? 2 : 1);
        if (digits.empty()) fail("Empty character reference");

        unsigned long cp = 0;
        for (char d : digits) {
            int v;
            if (std::isdigit(static_cast<unsigned char>(d))) v = d - '0';
            else if (hex && std::isxdigit(static_cast<unsigned char>(d))) v = std::tolower(static_cast<unsigned char>(d)) - 'a' + 10;
            else fail("Malformed character reference &" + ref + ";");
            cp = cp * (hex ? 16 : 10) + static_cast<unsigned long>(v);
            if (cp > 0x10FFFF) fail("Character reference out of range &" + ref + ";");
        }
        if (cp == 0) fail("Character reference to NUL");
        append_utf8(out, static_cast<char32_t>(cp));
        return;
    }

    fail("Unknown entity &" + ref + ";");
}

} // namespace WikiCorpus
