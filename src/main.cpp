#include <rcat/aggregator.hpp>
#include <rcat/cli.hpp>
#include <rcat/clipboard.hpp>
#include <rcat/config.hpp>
#include <rcat/log.hpp>
#include <rcat/size.hpp>
#include <CLI/CLI.hpp>
#include <cstdio>
#include <optional>

using namespace rcat;

static int fail(const RcatError& err) {
    std::fprintf(stderr, "%s\n", err.format().c_str());
    return 1;
}

// Status lines and the summary go to stderr; suppressed by --quiet.
static void report(const AggregateResult& result, const Config& cfg) {
    if (!log::enabled(log::Info)) return;

    const char* verb = cfg.to_stdout ? "output" : "copy";
    if (result.output.empty()) {
        std::fprintf(stderr, "No files found to %s\n", verb);
    } else if (cfg.to_stdout) {
        std::fprintf(stderr, "Successfully output %s to stdout\n",
                     format_bytes(result.output.size()).c_str());
    } else {
        std::fprintf(stderr, "Successfully copied %s to clipboard\n",
                     format_bytes(result.output.size()).c_str());
    }
    if (result.truncated()) {
        std::fprintf(stderr, "Content truncated at %s limit\n",
                     format_as_unit(cfg.max_size).c_str());
    }
    std::fprintf(stderr, "\n%s\n", result.stats.summary().c_str());
}

int main(int argc, char** argv) {
    CLI::App app{"rcat"};
    CliArgs args;
    configure_cli(app, args);

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    }

    // -v / -q apply before config files load so their diagnostics are visible
    if (args.verbose) log::set_level(log::Debug);
    if (args.quiet) log::set_level(log::Warn);

    Config cfg;
    if (!args.no_config) {
        auto discovered = Config::discover();
        if (discovered.is_err()) return fail(discovered.error());
        cfg = std::move(discovered).value();
    }

    auto applied = apply_cli(args, cfg);
    if (applied.is_err()) return fail(applied.error());
    log::set_level(cfg.log_level);

    // Find the clipboard tool before doing any work
    std::optional<ClipboardTool> tool;
    if (!cfg.to_stdout) {
        auto detected = detect_clipboard_tool();
        if (detected.is_err()) return fail(detected.error());
        tool = std::move(detected).value();
    }

    auto result = aggregate(root_paths(args), cfg.aggregate_options());
    if (result.is_err()) return fail(result.error());
    const auto& run = result.value();

    if (!run.output.empty()) {
        Status delivered = tool ? copy_to_clipboard(*tool, run.output)
                                : write_to_stdout(run.output);
        if (delivered.is_err()) return fail(delivered.error());
    }

    report(run, cfg);
    return 0;
}
