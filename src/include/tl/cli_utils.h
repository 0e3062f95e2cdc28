#pragma once

#include <algorithm>
#include <numeric>
#include <string>
#include <vector>

namespace tl {
namespace cli_utils {

// Edit distance (insert, delete, substitute) between two flags
inline size_t levenshtein_distance(const std::string& a, const std::string& b) {
    std::vector<size_t> prev(b.size() + 1);
    std::vector<size_t> row(b.size() + 1);
    std::iota(prev.begin(), prev.end(), size_t{0});

    for (size_t i = 1; i <= a.size(); ++i) {
        row[0] = i;
        for (size_t j = 1; j <= b.size(); ++j) {
            size_t substitute = prev[j - 1] + (a[i - 1] == b[j - 1] ? 0 : 1);
            row[j] = std::min({prev[j] + 1, row[j - 1] + 1, substitute});
        }
        std::swap(prev, row);
    }
    return prev[b.size()];
}

// The known flag closest to `arg`, or "" when none is close enough to be a
// plausible typo (3 edits, or 40% of the length for long flags).
inline std::string closest_flag(const std::string& arg, const std::vector<std::string>& known) {
    std::string best;
    size_t best_distance = arg.size() + 1;
    for (const auto& flag : known) {
        size_t d = levenshtein_distance(arg, flag);
        if (d < best_distance) {
            best_distance = d;
            best = flag;
        }
    }
    size_t limit = std::max<size_t>(3, arg.size() * 2 / 5);
    return best_distance <= limit ? best : std::string();
}

inline std::string unknown_argument_message(const std::string& arg, const std::vector<std::string>& known) {
    std::string message = "Unknown argument: " + arg;
    std::string hint = closest_flag(arg, known);
    if (not hint.empty()) message += "\n  Did you mean '" + hint + "'?";
    return message;
}

} // namespace cli_utils
} // namespace tl
