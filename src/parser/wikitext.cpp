#include <parser/wikitext.hpp>
#include <utils/unicode.hpp>
#include <algorithm>
#include <cctype>
#include <cstring>

namespace WikiCorpus {

namespace {

/**
 * Memoised "next occurrence of any of these characters". Queries must use
 * non-decreasing positions, which keeps each scan pass linear.
 */
class NextOf {
public:
    NextOf(const std::string& s, const char* chars) : s_(s), chars_(chars) {}

    size_t from(size_t pos) {
        if (!valid_ || (cached_ != std::string::npos && cached_ < pos)) {
            cached_ = s_.find_first_of(chars_, pos);
            valid_ = true;
        }
        return cached_;
    }

private:
    const std::string& s_;
    const char* chars_;
    size_t cached_ = std::string::npos;
    bool valid_ = false;
};

bool starts_with_ci(const std::string& s, size_t pos, const char* prefix) {
    size_t len = std::strlen(prefix);
    if (pos + len > s.size()) return false;
    for (size_t i = 0; i < len; ++i) {
        if (std::tolower(static_cast<unsigned char>(s[pos + i])) != std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

bool is_layout_option(const std::string& opt) {
    static const char* keywords[] = {
        "thumb", "thumbnail", "frame", "framed", "frameless", "border",
        "left", "right", "center", "centre", "none", "upright",
        "baseline", "middle", "sub", "super", "top", "text-top", "bottom", "text-bottom"
    };
    std::string lower = opt;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (const char* kw : keywords) {
        if (lower == kw) return true;
    }
    for (const char* key : {"upright=", "alt=", "link=", "page=", "lang=", "class="}) {
        if (lower.rfind(key, 0) == 0) return true;
    }
    // 200px, x200px, 200x100px
    if (lower.size() > 2 && lower.compare(lower.size() - 2, 2, "px") == 0) {
        std::string dims = lower.substr(0, lower.size() - 2);
        return !dims.empty() && std::all_of(dims.begin(), dims.end(),
                                            [](char c) { return std::isdigit(static_cast<unsigned char>(c)) || c == 'x'; });
    }
    return false;
}

} // namespace

std::string WikitextExtractor::strip_templates(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    NextOf next_close(text, "}");

    const size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        if (text[i] == '{' && i + 1 < n && text[i + 1] == '{') {
            size_t close = next_close.from(i + 2);
            if (close != std::string::npos && close > i + 2 && close + 1 < n && text[close + 1] == '}') {
                i = close + 2;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

std::string WikitextExtractor::resolve_links(const std::string& text) {
    // Internal links first: [[target]] or [[target|display]]
    std::string internal;
    internal.reserve(text.size());
    {
        NextOf next_stop(text, "]|");
        NextOf next_bracket(text, "]");
        const size_t n = text.size();
        size_t i = 0;
        while (i < n) {
            if (text[i] == '[' && i + 1 < n && text[i + 1] == '[') {
                size_t t_end = next_stop.from(i + 2);
                if (t_end != std::string::npos && t_end > i + 2) {
                    if (text[t_end] == ']') {
                        if (t_end + 1 < n && text[t_end + 1] == ']') {
                            internal.append(text, i + 2, t_end - i - 2);
                            i = t_end + 2;
                            continue;
                        }
                    } else {
                        size_t d = t_end + 1;
                        size_t d_end = next_bracket.from(d);
                        if (d_end != std::string::npos && d_end > d && d_end + 1 < n && text[d_end + 1] == ']') {
                            internal.append(text, d, d_end - d);
                            i = d_end + 2;
                            continue;
                        }
                    }
                }
            }
            internal.push_back(text[i]);
            ++i;
        }
    }

    // External links: [url] or [url display text]
    std::string out;
    out.reserve(internal.size());
    NextOf next_url_stop(internal, " \t\n\r\f\v]");
    NextOf next_bracket(internal, "]");
    const size_t n = internal.size();
    size_t i = 0;
    while (i < n) {
        if (internal[i] == '[') {
            size_t u_end = next_url_stop.from(i + 1);
            if (u_end != std::string::npos && u_end > i + 1) {
                if (internal[u_end] == ']') {
                    out.append(internal, i + 1, u_end - i - 1);
                    i = u_end + 1;
                    continue;
                }
                size_t w_end = u_end;
                while (w_end < n && is_space(internal[w_end])) ++w_end;
                if (w_end < n) {
                    if (internal[w_end] != ']') {
                        size_t close = next_bracket.from(w_end);
                        if (close != std::string::npos) {
                            out.append(internal, w_end, close - w_end);
                            i = close + 1;
                            continue;
                        }
                    } else if (w_end - u_end >= 2) {
                        // "[url  ]": the display text is the whitespace after the first blank
                        out.append(internal, u_end + 1, w_end - u_end - 1);
                        i = w_end + 1;
                        continue;
                    }
                }
            }
        }
        out.push_back(internal[i]);
        ++i;
    }
    return out;
}

std::string WikitextExtractor::strip_tags(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    NextOf next_gt(text, ">");

    const size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        if (text[i] == '<') {
            size_t close = next_gt.from(i + 1);
            if (close != std::string::npos && close > i + 1) {
                i = close + 1;
                continue;
            }
        }
        out.push_back(text[i]);
        ++i;
    }
    return out;
}

std::string WikitextExtractor::collapse_blank_lines(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    bool previous_blank = false;
    size_t start = 0;
    while (start <= text.size()) {
        size_t nl = text.find('\n', start);
        size_t end = (nl == std::string::npos) ? text.size() : nl;

        bool blank = std::all_of(text.begin() + start, text.begin() + end,
                                 [](char c) { return is_space(c); });
        if (!(blank && previous_blank)) {
            if (!blank) out.append(text, start, end - start);
            if (nl != std::string::npos) out.push_back('\n');
        }
        previous_blank = blank;

        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return out;
}

std::string WikitextExtractor::clean(const std::string& text) {
    return trim(collapse_blank_lines(strip_tags(resolve_links(strip_templates(text)))));
}

std::optional<std::string> WikitextExtractor::extract_redirect_target(const std::string& text) {
    size_t pos = text.find('#');
    while (pos != std::string::npos) {
        if (starts_with_ci(text, pos, "#redirect")) {
            size_t k = pos + 9;
            while (k < text.size() && is_space(text[k])) ++k;
            if (text.compare(k, 2, "[[") == 0) {
                size_t close = text.find(']', k + 2);
                if (close != std::string::npos && close > k + 2 && text.compare(close, 2, "]]") == 0) {
                    std::string target = trim(text.substr(k + 2, close - k - 2));
                    if (!target.empty()) return target;
                }
            }
        }
        pos = text.find('#', pos + 1);
    }
    return std::nullopt;
}

std::set<std::string> WikitextExtractor::extract_categories(const std::string& text) {
    std::set<std::string> categories;

    size_t pos = text.find("[[");
    while (pos != std::string::npos) {
        size_t next = pos + 2;
        if (starts_with_ci(text, pos + 2, "category:")) {
            size_t start = pos + 11;
            size_t close = text.find(']', start);
            if (close != std::string::npos && close > start && text.compare(close, 2, "]]") == 0) {
                std::string body = text.substr(start, close - start);
                std::string name = trim(body.substr(0, body.find('|')));
                if (!name.empty()) categories.insert(name);
                next = close + 2;
            }
        }
        pos = text.find("[[", next);
    }
    return categories;
}

std::vector<WikitextExtractor::ImageMarkup> WikitextExtractor::extract_image_references(const std::string& text) {
    std::vector<ImageMarkup> images;

    size_t pos = text.find("[[");
    while (pos != std::string::npos) {
        size_t next = pos + 2;
        size_t start = std::string::npos;
        if (starts_with_ci(text, pos + 2, "file:")) start = pos + 7;
        else if (starts_with_ci(text, pos + 2, "image:")) start = pos + 8;

        if (start != std::string::npos) {
            size_t f_end = text.find_first_of("]|", start);
            if (f_end != std::string::npos && f_end > start) {
                if (text[f_end] == ']') {
                    if (text.compare(f_end, 2, "]]") == 0) {
                        images.push_back({trim(text.substr(start, f_end - start)), std::nullopt});
                        next = f_end + 2;
                    }
                } else {
                    size_t o_end = text.find(']', f_end + 1);
                    if (o_end != std::string::npos && o_end > f_end + 1 && text.compare(o_end, 2, "]]") == 0) {
                        images.push_back({trim(text.substr(start, f_end - start)),
                                          trim(text.substr(f_end + 1, o_end - f_end - 1))});
                        next = o_end + 2;
                    }
                }
            }
        }
        pos = text.find("[[", next);
    }
    return images;
}

std::optional<std::string> WikitextExtractor::image_caption(const std::optional<std::string>& options) {
    if (!options || options->empty()) return std::nullopt;

    size_t bar = options->rfind('|');
    std::string last = trim(bar == std::string::npos ? *options : options->substr(bar + 1));
    if (last.empty() || is_layout_option(last)) return std::nullopt;
    return last;
}

} // namespace WikiCorpus
