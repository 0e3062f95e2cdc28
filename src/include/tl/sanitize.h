#pragma once

#include <cstddef>
#include <string>

namespace tl {

// Text passes that turn a relaxed config file into strict JSON. All of them
// are pure and keep byte offsets of the surviving text where they can.

// Drop a leading UTF-8 byte order mark (EF BB BF), if any.
std::string strip_bom(const std::string& text);

// Replace // and /* */ comments outside of strings with whitespace. Every
// non-whitespace byte of a comment becomes ' ', whitespace bytes are kept, so
// line and column numbers are unchanged. An unterminated block comment runs to
// the end of the input.
std::string strip_comments(const std::string& text);

// Replace a dangling comma (one followed only by whitespace and then '}' or
// ']') with a single space. Expects comment-free input.
//
// Only the comma nearest the closer is rewritten:
//   strip_dangling_commas("[1,2,]")  == "[1,2 ]"
//   strip_dangling_commas("[1,2,,]") == "[1,2, ]"
// An unterminated string swallows the rest of the input unchanged.
std::string strip_dangling_commas(const std::string& text);

// True when text is empty or consists only of whitespace.
bool is_blank(const std::string& text);

// Number of bytes of whitespace starting at text[pos], 0 if there is none.
// Covers ASCII whitespace and the UTF-8 encoded Unicode space separators,
// line/paragraph separators and U+FEFF.
size_t whitespace_length(const std::string& text, size_t pos);

// True when the '"' at quote_pos is preceded by an odd number of backslashes.
bool is_escaped(const std::string& text, size_t quote_pos);

}  // namespace tl
