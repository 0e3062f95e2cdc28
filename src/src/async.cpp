#include <tl/async.h>

namespace fs = std::filesystem;

namespace tl {

std::future<std::optional<fs::path>> resolve_async(fs::path cwd, std::string filename, Options options) {
    return std::async(std::launch::async,
                      [cwd = std::move(cwd), filename = std::move(filename), options = std::move(options)] {
                          return resolve(cwd, filename, options);
                      });
}

std::future<std::optional<fs::path>> find_async(fs::path dir, Options options) {
    return std::async(std::launch::async, [dir = std::move(dir), options = std::move(options)] {
        return find(dir, options);
    });
}

std::future<Value> read_file_async(fs::path path, Options options) {
    return std::async(std::launch::async, [path = std::move(path), options = std::move(options)] {
        return read_file(path, options);
    });
}

std::future<LoadResult> load_async(fs::path cwd, std::string filename, Options options) {
    return std::async(std::launch::async,
                      [cwd = std::move(cwd), filename = std::move(filename), options = std::move(options)] {
                          return load(cwd, filename, options);
                      });
}

}  // namespace tl
