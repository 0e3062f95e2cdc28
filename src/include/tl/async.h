#pragma once

#include <tl/tsconfig.h>
#include <future>

namespace tl {

// Non-blocking forms of the operations that touch the filesystem. Each runs
// the blocking operation on its own thread; the arguments are copied into the
// task. Results and exceptions are delivered through the future exactly as
// the blocking call would return or throw them.

std::future<std::optional<std::filesystem::path>> resolve_async(std::filesystem::path cwd,
                                                                std::string filename = "",
                                                                Options options = {});

std::future<std::optional<std::filesystem::path>> find_async(std::filesystem::path dir,
                                                             Options options = {});

std::future<Value> read_file_async(std::filesystem::path path, Options options = {});

std::future<LoadResult> load_async(std::filesystem::path cwd,
                                   std::string filename = "",
                                   Options options = {});

}  // namespace tl
