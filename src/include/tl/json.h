#pragma once

#include <tl/dictionary.hpp>
#include <tl/errors.h>
#include <string>

namespace tl {

// Strict RFC 8259 parser. No comments, no trailing commas, exactly one
// top-level value of any type. Throws JsonParseError.
Value parse_json(const std::string& text);

// Serialize a value as JSON. indent < 0 gives the compact form.
std::string dump_json(const Value& value, int indent = -1);

}  // namespace tl
