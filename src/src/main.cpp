#include <cstdlib>
#include <iostream>
#include <string>
#include <filesystem>
#include <tl/cli_args.h>
#include <tl/json.h>
#include <tl/tsconfig.h>

int main(int argc, const char* argv[]) {
    tl::CliArgs args = [&]() {
        try {
            return tl::CliArgs(argc, argv);
        } catch (const std::invalid_argument& e) {
            std::cerr << "error: " << e.what() << "\n";
            std::cerr << "Run 'tsload --help' for usage.\n";
            std::exit(2);
        }
    }();

    if (args.getAction() == tl::CliArgs::Action::HELP) {
        std::cout << tl::usage();
        return 0;
    }

    try {
        // current_path() throws when the working directory has been removed
        std::filesystem::path cwd = args.getCwd().empty() ? std::filesystem::current_path()
                                                          : std::filesystem::path(args.getCwd());

        if (args.getAction() == tl::CliArgs::Action::FIND) {
            auto path = tl::resolve(cwd, args.getProject(), args.getOptions());
            if (path) std::cout << path->string() << "\n";
            return 0;
        }

        tl::LoadResult result = tl::load(cwd, args.getProject(), args.getOptions());
        std::cout << "path: " << (result.path ? result.path->string() : std::string("(none)")) << "\n";
        std::cout << tl::dump_json(result.config, args.getIndent()) << "\n";
        return 0;
    } catch (const tl::JsonParseError& e) {
        std::cerr << "parse error: " << e.what() << "\n";
        return 1;
    } catch (const tl::NotFoundError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 2;
    }
}
