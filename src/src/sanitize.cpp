#include <tl/sanitize.h>

namespace tl {

namespace {
    const std::string utf8_bom = "\xEF\xBB\xBF";

    bool starts_with_at(const std::string& text, size_t pos, const char* prefix) {
        return text.compare(pos, std::char_traits<char>::length(prefix), prefix) == 0;
    }

    // Comment bytes become spaces; whitespace inside the comment survives.
    void append_blanked(std::string& out, const std::string& text, size_t from, size_t to) {
        size_t k = from;
        while (k < to) {
            size_t ws = whitespace_length(text, k);
            if (ws > 0 and k + ws <= to) {
                out.append(text, k, ws);
                k += ws;
            } else {
                out.push_back(' ');
                ++k;
            }
        }
    }
}

size_t whitespace_length(const std::string& text, size_t pos) {
    if (pos >= text.size()) return 0;
    unsigned char c = static_cast<unsigned char>(text[pos]);
    switch (c) {
        case ' ': case '\t': case '\n': case '\v': case '\f': case '\r':
            return 1;
        default:
            break;
    }
    if (c < 0xC2) return 0;
    // U+00A0
    if (starts_with_at(text, pos, "\xC2\xA0")) return 2;
    // U+1680
    if (starts_with_at(text, pos, "\xE1\x9A\x80")) return 3;
    if (c == 0xE2 and pos + 2 < text.size()) {
        unsigned char b1 = static_cast<unsigned char>(text[pos + 1]);
        unsigned char b2 = static_cast<unsigned char>(text[pos + 2]);
        // U+2000..U+200A, U+2028, U+2029, U+202F
        if (b1 == 0x80 and ((b2 >= 0x80 and b2 <= 0x8A) or b2 == 0xA8 or b2 == 0xA9 or b2 == 0xAF)) return 3;
        // U+205F
        if (b1 == 0x81 and b2 == 0x9F) return 3;
    }
    // U+3000
    if (starts_with_at(text, pos, "\xE3\x80\x80")) return 3;
    // U+FEFF
    if (starts_with_at(text, pos, "\xEF\xBB\xBF")) return 3;
    return 0;
}

bool is_escaped(const std::string& text, size_t quote_pos) {
    size_t backslashes = 0;
    size_t k = quote_pos;
    while (k > 0 and text[k - 1] == '\\') {
        --k;
        ++backslashes;
    }
    return backslashes % 2 == 1;
}

bool is_blank(const std::string& text) {
    size_t k = 0;
    while (k < text.size()) {
        size_t ws = whitespace_length(text, k);
        if (ws == 0) return false;
        k += ws;
    }
    return true;
}

std::string strip_bom(const std::string& text) {
    if (text.compare(0, utf8_bom.size(), utf8_bom) == 0) return text.substr(utf8_bom.size());
    return text;
}

std::string strip_comments(const std::string& text) {
    enum class Comment { None, Line, Block };

    std::string out;
    out.reserve(text.size());
    bool inside_string = false;
    Comment comment = Comment::None;
    size_t offset = 0;

    for (size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        char next = i + 1 < text.size() ? text[i + 1] : '\0';

        if (comment == Comment::None and c == '"' and not is_escaped(text, i)) {
            inside_string = not inside_string;
        }
        if (inside_string) continue;

        if (comment == Comment::None and c == '/' and next == '/') {
            out.append(text, offset, i - offset);
            offset = i;
            comment = Comment::Line;
            ++i;
        } else if (comment == Comment::Line and c == '\r' and next == '\n') {
            ++i;
            comment = Comment::None;
            append_blanked(out, text, offset, i);
            offset = i;
        } else if (comment == Comment::Line and c == '\n') {
            comment = Comment::None;
            append_blanked(out, text, offset, i);
            offset = i;
        } else if (comment == Comment::None and c == '/' and next == '*') {
            out.append(text, offset, i - offset);
            offset = i;
            comment = Comment::Block;
            ++i;
        } else if (comment == Comment::Block and c == '*' and next == '/') {
            ++i;
            comment = Comment::None;
            append_blanked(out, text, offset, i + 1);
            offset = i + 1;
        }
    }

    if (comment != Comment::None) append_blanked(out, text, offset, text.size());
    else out.append(text, offset, std::string::npos);
    return out;
}

std::string strip_dangling_commas(const std::string& text) {
    // candidate is the position of the last comma seen outside a string that
    // has not yet been followed by anything but whitespace
    const size_t none = std::string::npos;
    bool inside_string = false;
    size_t offset = 0;
    size_t candidate = none;
    std::string result;
    result.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];

        if (c == '"' and not is_escaped(text, i)) {
            inside_string = not inside_string;
        }

        if (inside_string) {
            candidate = none;
            ++i;
            continue;
        }
        if (c == ',') {
            candidate = i;
            ++i;
            continue;
        }
        if (candidate != none) {
            if (c == '}' or c == ']') {
                result.append(text, offset, candidate - offset);
                result.push_back(' ');
                offset = candidate + 1;
                candidate = none;
            } else {
                size_t ws = whitespace_length(text, i);
                if (ws > 0) {
                    i += ws;
                    continue;
                }
                candidate = none;
            }
        }
        ++i;
    }

    result.append(text, offset, std::string::npos);
    return result;
}

}  // namespace tl
