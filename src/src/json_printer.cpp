#include <tl/json.h>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <limits>
#include <locale>
#include <sstream>

namespace tl {

namespace {

void write_string(std::ostream& out, const std::string& s) {
    out << '"';
    for (char ch : s) {
        unsigned char c = static_cast<unsigned char>(ch);
        switch (ch) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\b': out << "\\b"; break;
            case '\f': out << "\\f"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (c < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c)
                        << std::dec << std::setfill(' ');
                } else {
                    out << ch;
                }
        }
    }
    out << '"';
}

// Shortest of 15 or 17 significant digits that reads back to the same
// double. Always carries a '.' or exponent so it re-parses as a double.
std::string format_double(double d) {
    if (not std::isfinite(d)) return "null";
    std::string text;
    for (int precision : {15, 17}) {
        std::ostringstream ss;
        ss.imbue(std::locale::classic());
        ss << std::setprecision(precision) << d;
        text = ss.str();
        std::istringstream back(text);
        back.imbue(std::locale::classic());
        double r = 0.0;
        if (back >> r and r == d) break;
    }
    if (text.find_first_of(".eE") == std::string::npos) text += ".0";
    return text;
}

struct Printer {
    std::ostringstream out;
    int indent;

    explicit Printer(int indent_) : indent(indent_) { out.imbue(std::locale::classic()); }

    void newline(int level) {
        if (indent < 0) return;
        out << '\n' << std::string(static_cast<size_t>(level), ' ');
    }

    void print(const Value& val, int level) {
        if (val.is_null()) { out << "null"; return; }
        if (val.is_int()) { out << val.as_int(); return; }
        if (val.is_double()) { out << format_double(val.as_double()); return; }
        if (val.is_bool()) { out << (val.as_bool() ? "true" : "false"); return; }
        if (val.is_string()) { write_string(out, val.as_string()); return; }
        if (val.is_list()) {
            const auto &L = val.as_list();
            if (L.empty()) { out << "[]"; return; }
            out << '[';
            for (size_t i = 0; i < L.size(); ++i) {
                if (i > 0) out << ',';
                newline(level + indent);
                print(L[i], level + indent);
            }
            newline(level);
            out << ']';
            return;
        }
        const Dictionary& d = val.as_dict();
        if (d.empty()) { out << "{}"; return; }
        out << '{';
        bool first = true;
        for (auto const &kv : d.data) {
            if (not first) out << ',';
            first = false;
            newline(level + indent);
            write_string(out, kv.first);
            out << (indent < 0 ? ":" : ": ");
            print(kv.second, level + indent);
        }
        newline(level);
        out << '}';
    }
};

}  // namespace

std::string dump_json(const Value& value, int indent) {
    Printer printer(indent);
    printer.print(value, 0);
    return printer.out.str();
}

std::string Value::dump(int indent) const { return dump_json(*this, indent); }

}  // namespace tl
