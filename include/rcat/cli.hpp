#pragma once

#include <rcat/config.hpp>
#include <rcat/result.hpp>
#include <filesystem>
#include <string>
#include <vector>

namespace CLI {
class App;
}

namespace rcat {

// Raw command-line values. Size options stay strings until apply_cli so a
// bad size is reported as an rcat error rather than a usage error.
struct CliArgs {
    std::vector<std::string> paths;
    bool all = false;
    std::string max_size;
    std::string max_file_size;
    std::vector<std::string> excludes;
    bool to_stdout = false;
    int threads = -1;           // -1 = not given
    bool verbose = false;
    bool quiet = false;
    bool no_config = false;
};

// Register every option on `app`, bound to fields of `args`.
void configure_cli(CLI::App& app, CliArgs& args);

// Layer command-line values on top of `cfg`.
Status apply_cli(const CliArgs& args, Config& cfg);

// Positional paths, or "." when none were given.
std::vector<std::filesystem::path> root_paths(const CliArgs& args);

} // namespace rcat
