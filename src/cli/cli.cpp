#include <rcat/cli.hpp>
#include <rcat/size.hpp>
#include <CLI/CLI.hpp>

namespace rcat {

static const char* kFooter =
    "Examples:\n"
    "  rcat                         copy the current directory to the clipboard\n"
    "  rcat src include -o          print two trees to stdout\n"
    "  rcat -e '*.log' -e build/    skip log files and the build directory\n"
    "  rcat -a -f 1MB .             include hidden and ignored files up to 1MB each\n"
    "\n"
    "Defaults can be set in ~/.rcat/config.toml and ./.rcat.toml.";

void configure_cli(CLI::App& app, CliArgs& args) {
    app.description("Concatenate the text files of a directory tree for the clipboard or stdout.");
    app.footer(kFooter);

    app.add_option("paths", args.paths, "Files or directories to read (default: .)");
    app.add_flag("-a,--all", args.all,
                 "Include hidden files and files ignored by .gitignore");
    app.add_option("-m,--max-size", args.max_size,
                   "Total output limit, e.g. 5MB (default: 5MB)");
    app.add_option("-f,--max-file-size", args.max_file_size,
                   "Per-file limit, e.g. 500KB (default: 500KB)");
    app.add_option("-e,--exclude", args.excludes,
                   "Glob pattern to exclude; may be repeated")
        ->allow_extra_args(false);
    app.add_flag("-o,--stdout", args.to_stdout,
                 "Write to stdout instead of the clipboard");
    app.add_option("-j,--threads", args.threads,
                   "Worker threads (0 = automatic)")
        ->check(CLI::NonNegativeNumber);
    auto* verbose = app.add_flag("-v,--verbose", args.verbose, "Debug logging on stderr");
    auto* quiet = app.add_flag("-q,--quiet", args.quiet, "Only print warnings and errors");
    verbose->excludes(quiet);
    app.add_flag("--no-config", args.no_config,
                 "Ignore ~/.rcat/config.toml and ./.rcat.toml");
}

Status apply_cli(const CliArgs& args, Config& cfg) {
    Config layer;

    if (!args.max_size.empty()) {
        auto v = parse_size(args.max_size);
        if (v.is_err()) {
            auto err = std::move(v).error();
            err.message = "--max-size: " + err.message;
            return err;
        }
        layer.max_size = v.value();
        layer.max_size_set = true;
    }
    if (!args.max_file_size.empty()) {
        auto v = parse_size(args.max_file_size);
        if (v.is_err()) {
            auto err = std::move(v).error();
            err.message = "--max-file-size: " + err.message;
            return err;
        }
        layer.max_file_size = v.value();
        layer.max_file_size_set = true;
    }
    if (args.all) {
        layer.include_all = true;
        layer.include_all_set = true;
    }
    if (args.to_stdout) {
        layer.to_stdout = true;
        layer.to_stdout_set = true;
    }
    if (args.threads >= 0) {
        layer.threads = static_cast<unsigned>(args.threads);
        layer.threads_set = true;
    }
    if (args.verbose) {
        layer.log_level = log::Debug;
        layer.log_level_set = true;
    } else if (args.quiet) {
        layer.log_level = log::Warn;
        layer.log_level_set = true;
    }
    layer.excludes = args.excludes;

    cfg.merge(layer);
    return ok_status();
}

std::vector<std::filesystem::path> root_paths(const CliArgs& args) {
    std::vector<std::filesystem::path> roots;
    for (const auto& p : args.paths) roots.emplace_back(p);
    if (roots.empty()) roots.emplace_back(".");
    return roots;
}

} // namespace rcat
