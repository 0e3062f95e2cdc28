#pragma once

#include <string>

namespace tl {

// Name of the file looked for when no explicit file is given, and inside a
// directory that is given explicitly.
inline constexpr const char* CONFIG_FILENAME = "tsconfig.json";

struct Options {
    std::string config_filename = CONFIG_FILENAME;
    // When true, resolution and reads are traced to std::cerr.
    bool verbose = false;
};

}  // namespace tl
