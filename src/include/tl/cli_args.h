#pragma once

#include <tl/options.h>
#include <string>

namespace tl {

// Parses command-line arguments for the tsload tool
class CliArgs {
public:
    enum class Action {
        HELP,      // Show help message
        LOAD,      // Resolve, load and print the config (default)
        FIND       // Print only the resolved path
    };

    CliArgs(int argc, const char* argv[]);

    // Accessors
    Action getAction() const { return action_; }
    const std::string& getProject() const { return project_; }
    const std::string& getCwd() const { return cwd_; }
    const Options& getOptions() const { return options_; }
    int getIndent() const { return indent_; }

private:
    Action action_ = Action::LOAD;
    std::string project_;
    std::string cwd_;
    Options options_;
    int indent_ = 2;
};

// Text printed for --help
const char* usage();

} // namespace tl
