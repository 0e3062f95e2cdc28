#pragma once

#include <tl/errors.h>
#include <tl/options.h>
#include <filesystem>
#include <optional>
#include <string>

namespace tl {

// Locate the config file the way `tsc` does.
//
// With an empty `filename`, search upwards from `cwd` (see find()).
// Otherwise `filename` is resolved against `cwd` and must name a file, or a
// directory holding `options.config_filename`; anything else throws
// NotFoundError carrying `filename`.
std::optional<std::filesystem::path> resolve(const std::filesystem::path& cwd,
                                             const std::string& filename = "",
                                             const Options& options = {});

// Look for `options.config_filename` in `dir`, then in each parent directory
// up to and including the filesystem root. Returns std::nullopt when the root
// is reached without a match; never throws for a missing file.
std::optional<std::filesystem::path> find(const std::filesystem::path& dir,
                                          const Options& options = {});

// Absolute, lexically normal form of `base / arg` without a trailing
// separator. An absolute `arg` replaces `base`.
std::filesystem::path resolve_path(const std::filesystem::path& base, const std::string& arg = "");

// Regular files and FIFOs count as files. Symlinks are followed; any stat
// failure counts as "not a file".
bool is_file_like(const std::filesystem::path& p);

}  // namespace tl
