#include <tl/json.h>
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <locale>
#include <sstream>
#include <vector>

namespace tl {

namespace {
    constexpr size_t max_depth = 1000;

    bool is_json_ws(char c) {
        return c == ' ' or c == '\t' or c == '\n' or c == '\r';
    }

    void append_utf8(std::string& out, uint32_t cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
            return;
        }
        // number of continuation bytes and the lead byte marker
        int extra = cp < 0x800 ? 1 : cp < 0x10000 ? 2 : 3;
        static const unsigned char lead[] = {0, 0xC0, 0xE0, 0xF0};
        out.push_back(static_cast<char>(lead[extra] | (cp >> (6 * extra))));
        for (int k = extra - 1; k >= 0; --k) {
            out.push_back(static_cast<char>(0x80 | ((cp >> (6 * k)) & 0x3F)));
        }
    }

    struct Parser {
        const std::string& s;
        size_t i = 0;
        size_t line = 1;
        size_t col = 1;

        struct Opener { char ch; size_t line, col; };
        std::vector<Opener> opener_stack;

        Parser(const std::string& str) : s(str) {}

        bool at_end() const { return i >= s.size(); }
        char peek() const { return i < s.size() ? s[i] : '\0'; }

        char get() {
            if (i >= s.size()) return '\0';
            char c = s[i++];
            if (c == '\n') { ++line; col = 1; }
            else ++col;
            return c;
        }

        void push_opener(char ch) {
            if (opener_stack.size() >= max_depth) fail("nesting too deep");
            opener_stack.push_back(Opener{ch, line, col});
        }
        void pop_opener() {
            if (opener_stack.empty()) return;
            opener_stack.pop_back();
        }

        // "<base> (line L, column C)", the offending line, a caret under the
        // column (counted in bytes) and, inside a container, where it opened.
        std::string format_error(const std::string& base, size_t err_line, size_t err_col) const {
            size_t start = 0;
            for (size_t n = 1; n < err_line; ++n) {
                size_t nl = s.find('\n', start);
                if (nl == std::string::npos) { start = s.size(); break; }
                start = nl + 1;
            }
            size_t end = s.find_first_of("\r\n", start);
            std::string text = s.substr(start, end == std::string::npos ? std::string::npos : end - start);
            size_t caret = std::min(err_col > 0 ? err_col - 1 : 0, text.size());

            std::ostringstream ss;
            ss << base << " (line " << err_line << ", column " << err_col << ")\n"
               << text << "\n" << std::string(caret, ' ') << '^';
            if (not opener_stack.empty()) {
                const Opener& o = opener_stack.back();
                ss << "\n(opened at line " << o.line << ", column " << o.col << ")";
            }
            return ss.str();
        }

        [[noreturn]] void fail(const std::string& base) const {
            throw JsonParseError(format_error(base, line, col), line, col);
        }

        [[noreturn]] void fail_at(const std::string& base, size_t err_line, size_t err_col) const {
            throw JsonParseError(format_error(base, err_line, err_col), err_line, err_col);
        }

        void skip_ws() {
            while (i < s.size() and is_json_ws(s[i])) get();
        }

        // A short description of the byte at the cursor, for error messages.
        std::string describe_current() const {
            if (at_end()) return "end of input";
            unsigned char c = static_cast<unsigned char>(s[i]);
            std::ostringstream ss;
            if (c >= 0x20 and c < 0x7f) ss << "'" << s[i] << "'";
            else ss << "byte 0x" << std::hex << static_cast<int>(c);
            return ss.str();
        }

        Value parse_value() {
            skip_ws();
            if (at_end()) fail("unexpected end of input while parsing value");
            char c = peek();
            if (c == 'n') return parse_literal("null", Value());
            if (c == 't') return parse_literal("true", Value(true));
            if (c == 'f') return parse_literal("false", Value(false));
            if (c == '"') return parse_string();
            if (c == '[') return parse_array();
            if (c == '{') return parse_object();
            if (c == '-' or std::isdigit(static_cast<unsigned char>(c))) return parse_number();
            // hints for Python-style literals and unquoted paths
            if (std::isalpha(static_cast<unsigned char>(c))) {
                size_t j = i;
                while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_' or s[j] == '/' or s[j] == '.' or s[j] == '-' )) ++j;
                std::string token = s.substr(i, j - i);
                if (token == "True" or token == "False" or token == "None" or token == "NULL") {
                    std::string sug = (token == "True") ? "true" : (token == "False") ? "false" : "null";
                    fail("unexpected token while parsing value; did you mean '" + sug + "'?");
                }
                if (token.find('/') != std::string::npos or token.find('.') != std::string::npos) {
                    fail("unexpected token while parsing value; unquoted path/identifier '" + token + "', did you mean to quote it?");
                }
            }
            fail("unexpected " + describe_current() + " while parsing value");
        }

        Value parse_literal(const char* word, Value result) {
            std::string w(word);
            if (s.compare(i, w.size(), w) == 0) {
                size_t end = i + w.size();
                // reject e.g. "nullx" or "trueish"
                if (end >= s.size() or not std::isalnum(static_cast<unsigned char>(s[end]))) {
                    i = end; col += w.size();
                    return result;
                }
            }
            fail("invalid literal");
        }

        // the character a one-letter escape stands for, '\0' if it is not one
        static char simple_escape(char e) {
            switch (e) {
                case '"': case '\\': case '/': return e;
                case 'b': return '\b';
                case 'f': return '\f';
                case 'n': return '\n';
                case 'r': return '\r';
                case 't': return '\t';
                default: return '\0';
            }
        }

        static int hex_digit(char c) {
            unsigned char u = static_cast<unsigned char>(c);
            if (std::isdigit(u)) return c - '0';
            int lower = std::tolower(u);
            if (lower >= 'a' and lower <= 'f') return lower - 'a' + 10;
            return -1;
        }

        uint32_t parse_hex4() {
            uint32_t v = 0;
            for (int k = 0; k < 4; ++k) {
                if (at_end()) fail("unterminated unicode escape");
                int hv = hex_digit(peek());
                if (hv < 0) fail("invalid unicode escape");
                get();
                v = (v << 4) | static_cast<uint32_t>(hv);
            }
            return v;
        }

        Value parse_string() {
            size_t start_line = line, start_col = col;
            get(); // opening quote
            std::string out;
            while (true) {
                if (at_end()) fail_at("unterminated string", start_line, start_col);
                char c = peek();
                if (c == '"') { get(); break; }
                if (static_cast<unsigned char>(c) < 0x20) {
                    fail("control character in string; use an escape sequence");
                }
                get();
                if (c != '\\') {
                    out.push_back(c);
                    continue;
                }
                if (at_end()) fail_at("unterminated string", start_line, start_col);
                char e = get();
                if (char plain = simple_escape(e)) {
                    out.push_back(plain);
                    continue;
                }
                if (e != 'u') fail_at("invalid escape sequence", line, col - 2);
                uint32_t cp = parse_hex4();
                // combine a surrogate pair; a lone surrogate is kept as-is
                if (cp >= 0xD800 and cp <= 0xDBFF and s.compare(i, 2, "\\u") == 0) {
                    size_t save_i = i, save_col = col;
                    get(); get();
                    uint32_t lo = parse_hex4();
                    if (lo >= 0xDC00 and lo <= 0xDFFF) {
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    } else {
                        i = save_i; col = save_col;
                    }
                }
                append_utf8(out, cp);
            }
            return Value(std::move(out));
        }

        bool at_digit() const { return std::isdigit(static_cast<unsigned char>(peek())) != 0; }

        // consume a run of digits; false if there was none
        bool digits() {
            if (not at_digit()) return false;
            while (at_digit()) get();
            return true;
        }

        Value parse_number() {
            size_t start = i;
            if (peek() == '-') get();
            if (peek() == '0') {
                get();
                if (at_digit()) fail("invalid number; leading zeros are not allowed");
            } else if (not digits()) {
                fail("invalid number");
            }
            bool integral = true;
            if (peek() == '.') {
                integral = false;
                get();
                if (not digits()) fail("invalid number; expected digit after '.'");
            }
            if (peek() == 'e' or peek() == 'E') {
                integral = false;
                get();
                if (peek() == '+' or peek() == '-') get();
                if (not digits()) fail("invalid number; expected digit in exponent");
            }
            const std::string token = s.substr(start, i - start);
            if (integral) {
                int64_t v;
                std::istringstream ss(token);
                ss.imbue(std::locale::classic());
                if (ss >> v) return Value(v);
                // out of int64 range: fall through to double
            }
            // Out of range literals saturate the way JSON.parse does: overflow
            // gives +-infinity (dumped as null), underflow a subnormal or zero.
            // The token is already validated, so strtod consumes all of it.
            return Value(std::strtod(token.c_str(), nullptr));
        }

        Value parse_array() {
            push_opener('[');
            get();
            Value::list_t out_values;
            skip_ws();
            if (peek() == ']') { get(); pop_opener(); return Value(std::move(out_values)); }
            while (true) {
                out_values.emplace_back(parse_value());
                skip_ws();
                if (at_end()) fail("unexpected end of input; expected ',' or ']'");
                char c = peek();
                if (c == ']') { get(); pop_opener(); break; }
                if (c == ',') {
                    get(); skip_ws();
                    if (peek() == ']') fail("trailing comma before ']'");
                    continue;
                }
                if (c == ':') fail("unexpected ':' after value; found key/value pair inside array");
                fail("expected ',' or ']' but found " + describe_current());
            }
            return Value(std::move(out_values));
        }

        Value parse_object() {
            push_opener('{');
            get();
            Dictionary d;
            skip_ws();
            if (peek() == '}') { get(); pop_opener(); return Value(std::move(d)); }
            while (true) {
                skip_ws();
                if (peek() != '"') {
                    if (at_end()) fail("unexpected end of input; expected string key");
                    // attempt to read an identifier to provide a helpful suggestion
                    size_t j = i;
                    while (j < s.size() and (std::isalnum(static_cast<unsigned char>(s[j])) or s[j] == '_' or s[j] == '$')) ++j;
                    std::string base = "expected string key";
                    if (j > i) base += " - are you missing quotes around '" + s.substr(i, j - i) + "'?";
                    else if (peek() == '\'') base += " - single quotes are not allowed";
                    fail(base);
                }
                Value k = parse_string();
                skip_ws();
                if (peek() != ':') fail("expected ':' after object key");
                get();
                // later duplicates replace earlier ones
                d[k.as_string()] = parse_value();
                skip_ws();
                if (at_end()) fail("unexpected end of input; expected ',' or '}'");
                char c = peek();
                if (c == '}') { get(); pop_opener(); break; }
                if (c == ',') {
                    get(); skip_ws();
                    if (peek() == '}') fail("trailing comma before '}'");
                    continue;
                }
                if (c == '"') fail("expected ',' or '}'; is there a missing comma before this key?");
                fail("expected ',' or '}' but found " + describe_current());
            }
            return Value(std::move(d));
        }
    };
}

Value parse_json(const std::string& text) {
    Parser p(text);
    Value val = p.parse_value();
    p.skip_ws();
    if (not p.at_end()) p.fail("extra data after JSON value");
    return val;
}

} // namespace tl
