#include <tl/resolve.h>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace tl {

namespace {
    fs::file_status stat_or_none(const fs::path& p) {
        std::error_code ec;
        fs::file_status st = fs::status(p, ec);
        if (ec) return fs::file_status(fs::file_type::not_found);
        return st;
    }

    bool file_like_status(const fs::file_status& st) {
        return fs::is_regular_file(st) or fs::is_fifo(st);
    }
}

fs::path resolve_path(const fs::path& base, const std::string& arg) {
    fs::path p = base.empty() ? fs::current_path() : fs::absolute(base);
    if (not arg.empty()) p /= arg;
    p = p.lexically_normal();
    // "a/b/" normalises to "a/b/" with an empty filename; drop the separator
    if (not p.has_filename() and p != p.root_path()) p = p.parent_path();
    return p;
}

bool is_file_like(const fs::path& p) {
    return file_like_status(stat_or_none(p));
}

std::optional<fs::path> find(const fs::path& dir, const Options& options) {
    fs::path current = resolve_path(dir);
    while (true) {
        fs::path candidate = current / options.config_filename;
        if (options.verbose) std::cerr << "tsload: probe " << candidate.string() << "\n";
        if (is_file_like(candidate)) {
            if (options.verbose) std::cerr << "tsload: found " << candidate.string() << "\n";
            return candidate;
        }
        fs::path parent = current.parent_path();
        // the root is its own parent
        if (parent == current or parent.empty()) {
            if (options.verbose) std::cerr << "tsload: reached root, no " << options.config_filename << "\n";
            return std::nullopt;
        }
        current = parent;
    }
}

std::optional<fs::path> resolve(const fs::path& cwd, const std::string& filename, const Options& options) {
    if (filename.empty()) return find(cwd, options);

    fs::path full = resolve_path(cwd, filename);
    fs::file_status st = stat_or_none(full);

    if (file_like_status(st)) {
        if (options.verbose) std::cerr << "tsload: using file " << full.string() << "\n";
        return full;
    }

    if (fs::is_directory(st)) {
        fs::path config_file = full / options.config_filename;
        if (options.verbose) std::cerr << "tsload: " << filename << " is a directory, trying " << config_file.string() << "\n";
        if (is_file_like(config_file)) return config_file;
        throw NotFoundError("Cannot find a " + options.config_filename +
                                " file at the specified directory: " + filename,
                            filename);
    }

    throw NotFoundError("The specified path does not exist: " + filename, filename);
}

}  // namespace tl
