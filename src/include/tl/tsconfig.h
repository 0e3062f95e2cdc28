#pragma once

#include <tl/dictionary.hpp>
#include <tl/errors.h>
#include <tl/options.h>
#include <tl/resolve.h>
#include <filesystem>
#include <optional>
#include <string>

namespace tl {

struct LoadResult {
    // Empty when no config file was found above the start directory.
    std::optional<std::filesystem::path> path;
    Value config;
};

// {"compilerOptions": {}, "files": []}, used when no config file exists.
Value default_config();

// Turn the text of a config file into a document: strip BOM, comments and
// dangling commas, then parse as strict JSON. A blank file yields an empty
// object without running the JSON parser. Throws JsonParseError.
// Object members are kept sorted by key, not in file order, so dumping a
// parsed config may reorder it.
Value parse(const std::string& contents);

// Read and parse a config file. Read failures throw
// std::filesystem::filesystem_error with the errno of the failed call.
Value read_file(const std::filesystem::path& path, const Options& options = {});

// resolve() followed by read_file(). When nothing is found, path is empty and
// config is default_config().
LoadResult load(const std::filesystem::path& cwd,
                const std::string& filename = "",
                const Options& options = {});

}  // namespace tl
