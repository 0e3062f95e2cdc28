#include <tl/tsconfig.h>
#include <tl/json.h>
#include <tl/sanitize.h>
#include <cerrno>
#include <fstream>
#include <iostream>
#include <system_error>

namespace fs = std::filesystem;

namespace tl {

namespace {
    [[noreturn]] void throw_read_error(const fs::path& path, int err) {
        throw fs::filesystem_error("cannot read config file", path,
                                   std::error_code(err != 0 ? err : EIO, std::generic_category()));
    }
}

Value default_config() {
    Dictionary config;
    config["compilerOptions"] = Value::object();
    config["files"] = Value::list();
    return Value(std::move(config));
}

Value parse(const std::string& contents) {
    std::string data = strip_dangling_commas(strip_comments(strip_bom(contents)));

    // A tsconfig.json file is permitted to be completely empty.
    if (is_blank(data)) return Value::object();

    return parse_json(data);
}

Value read_file(const fs::path& path, const Options& options) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) throw_read_error(path, EISDIR);

    errno = 0;
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (not in) throw_read_error(path, errno);

    std::string contents;
    char buffer[4096];
    while (in.read(buffer, sizeof(buffer)) or in.gcount() > 0) {
        contents.append(buffer, static_cast<size_t>(in.gcount()));
        if (not in) break;
    }
    if (in.bad()) throw_read_error(path, errno);

    if (options.verbose) std::cerr << "tsload: read " << contents.size() << " bytes from " << path.string() << "\n";
    return parse(contents);
}

LoadResult load(const fs::path& cwd, const std::string& filename, const Options& options) {
    auto path = resolve(cwd, filename, options);
    if (not path) return LoadResult{std::nullopt, default_config()};

    Value config = read_file(*path, options);
    return LoadResult{path, std::move(config)};
}

}  // namespace tl
