#include <tl/cli_args.h>
#include <tl/cli_utils.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace tl {

namespace {
    int parse_indent(const std::string& text) {
        size_t used = 0;
        int value = 0;
        try {
            value = std::stoi(text, &used);
        } catch (const std::exception&) {
            throw std::invalid_argument("--indent expects an integer, got '" + text + "'");
        }
        if (used != text.size()) throw std::invalid_argument("--indent expects an integer, got '" + text + "'");
        if (value < -1 or value > 16) throw std::invalid_argument("--indent must be between -1 and 16");
        return value;
    }
}

const char* usage() {
    return "tsload - locate and load a tsconfig.json-style config file\n"
           "\n"
           "USAGE:\n"
           "  tsload [options]\n"
           "\n"
           "OPTIONS:\n"
           "  -p, --project <path>   config file, or directory containing one\n"
           "  -C, --cwd <dir>        directory to start from (default: current directory)\n"
           "      --config-name <f>  file name to search for (default: tsconfig.json)\n"
           "      --find             print only the resolved path\n"
           "      --indent <n>       indentation of the printed config, -1 for compact (default: 2)\n"
           "  -v, --verbose          trace the search on stderr\n"
           "  -h, --help             show this message\n";
}

CliArgs::CliArgs(int argc, const char* argv[]) {
    static const std::vector<std::string> valid_options = {
        "--project", "-p",
        "--cwd", "-C",
        "--config-name",
        "--find",
        "--indent",
        "--verbose", "-v",
        "--help", "-h"
    };

    auto value_of = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(flag + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            action_ = Action::HELP;
            return;
        }
        else if (arg == "--project" || arg == "-p") {
            project_ = value_of(i, arg);
            if (project_.empty()) throw std::invalid_argument(arg + " requires a non-empty path");
        }
        else if (arg == "--cwd" || arg == "-C") {
            cwd_ = value_of(i, arg);
        }
        else if (arg == "--config-name") {
            options_.config_filename = value_of(i, arg);
            if (options_.config_filename.empty()) throw std::invalid_argument("--config-name requires a non-empty name");
        }
        else if (arg == "--find") {
            action_ = Action::FIND;
        }
        else if (arg == "--indent") {
            indent_ = parse_indent(value_of(i, arg));
        }
        else if (arg == "--verbose" || arg == "-v") {
            options_.verbose = true;
        }
        else {
            throw std::invalid_argument(cli_utils::unknown_argument_message(arg, valid_options));
        }
    }
}

} // namespace tl
