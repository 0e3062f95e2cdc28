#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace tl {

// Strict JSON syntax error. The message already contains the location, the
// offending line and a caret; line/col are 1-based.
struct JsonParseError : public std::runtime_error {
    size_t line, col;
    JsonParseError(const std::string& msg, size_t l, size_t c)
        : std::runtime_error(msg), line(l), col(c) {}
};

// An explicit file or directory argument that does not lead to a config file.
// `argument` is the string the caller passed in, unresolved.
struct NotFoundError : public std::runtime_error {
    std::string argument;
    NotFoundError(const std::string& msg, std::string arg)
        : std::runtime_error(msg), argument(std::move(arg)) {}
};

}  // namespace tl
