#include <catch2/catch.hpp>
#include <rcat/aggregator.hpp>
#include <rcat/base64.hpp>
#include "temp_dir.hpp"
#include "capture_stderr.hpp"
#include <rcat/log.hpp>

using namespace rcat;
namespace fs = std::filesystem;

static std::string block(const fs::path& file, const std::string& content) {
    std::string out = "--- " + file.generic_string() + " ---\n" + content;
    if (!content.empty() && content.back() != '\n') out += '\n';
    return out + "\n";
}

static AggregateResult run_ok(const std::vector<fs::path>& roots, const AggregateOptions& opts) {
    auto r = aggregate(roots, opts);
    REQUIRE(r.is_ok());
    return std::move(r).value();
}

static std::string binary_payload(size_t n) {
    std::string s;
    s.reserve(n);
    for (size_t i = 0; i < n; ++i) s.push_back(static_cast<char>((i * 131 + 7) & 0xFF));
    s[0] = '\0';
    return s;
}

// ---- Formatting ----

TEST_CASE("text block always ends with a blank line", "[aggregator]") {
    FileRecord rec;
    rec.path = "src/a.txt";
    rec.disposition = IncludedText{"hello"};
    REQUIRE(format_record(rec) == "--- src/a.txt ---\nhello\n\n");

    rec.disposition = IncludedText{"hello\n"};
    REQUIRE(format_record(rec) == "--- src/a.txt ---\nhello\n\n");

    rec.disposition = IncludedText{""};
    REQUIRE(format_record(rec) == "--- src/a.txt ---\n\n");
}

TEST_CASE("binary marker and skipped records", "[aggregator]") {
    FileRecord rec;
    rec.path = "img.png";
    rec.disposition = MarkedBinary{};
    REQUIRE(format_record(rec) == "--- img.png ---\n<BINARY_FILE>\n\n");

    rec.disposition = Skipped{SkipReason::Oversized, "too big"};
    REQUIRE(format_record(rec).empty());

    rec.disposition = EmbeddedBinary{"AAEC\n", 3};
    REQUIRE(format_record(rec) == "--- img.png ---\n<BINARY_FILE base64 3 bytes>\nAAEC\n\n");
}

TEST_CASE("size budget accepts exact fits only", "[aggregator]") {
    SizeBudget budget;
    budget.total_limit = 100;
    REQUIRE(budget.try_consume(60));
    REQUIRE(budget.remaining() == 40);
    REQUIRE_FALSE(budget.try_consume(41));
    REQUIRE(budget.total_used == 60);
    REQUIRE(budget.try_consume(40));
    REQUIRE(budget.remaining() == 0);
    REQUIRE_FALSE(budget.try_consume(1));
    REQUIRE(budget.try_consume(0));

    budget.file_limit = 10;
    REQUIRE(budget.file_fits(10));
    REQUIRE_FALSE(budget.file_fits(11));
}

// ---- Reading ----

TEST_CASE("read_file_record dispositions", "[aggregator]") {
    TempDir tmp("agg");
    AggregateOptions opts;
    opts.max_file_size = 100;

    PathEntry e;
    e.path = tmp.write_file("a.txt", "text");
    e.size = 4;
    auto text = read_file_record(e, opts);
    REQUIRE(std::get<IncludedText>(text.disposition).content == "text");
    REQUIRE(text.classification == Classification::Text);

    e.path = tmp.write_file("b.bin", std::string("\0\1\2", 3));
    e.size = 3;
    auto marked = read_file_record(e, opts);
    REQUIRE(std::holds_alternative<MarkedBinary>(marked.disposition));

    opts.include_all = true;
    auto embedded = read_file_record(e, opts);
    const auto& bin = std::get<EmbeddedBinary>(embedded.disposition);
    REQUIRE(bin.raw_size == 3);
    REQUIRE(base64_decode(bin.encoded).value() == std::string("\0\1\2", 3));
}

TEST_CASE("oversized files are not opened", "[aggregator]") {
    AggregateOptions opts;
    opts.max_file_size = 10;

    PathEntry e;
    e.path = "/nonexistent/never-opened.txt";
    e.size = 11;
    auto rec = read_file_record(e, opts);
    REQUIRE(std::get<Skipped>(rec.disposition).reason == SkipReason::Oversized);
}

TEST_CASE("a file that grew past the limit is oversized", "[aggregator]") {
    TempDir tmp("agg");
    AggregateOptions opts;
    opts.max_file_size = 10;

    PathEntry e;
    e.path = tmp.write_file("grew.txt", "0123456789ABCDEF");
    e.size = 5;  // as listed before it grew
    auto rec = read_file_record(e, opts);
    REQUIRE(std::get<Skipped>(rec.disposition).reason == SkipReason::Oversized);
}

TEST_CASE("a vanished file is a read error", "[aggregator]") {
    TempDir tmp("agg");
    PathEntry e;
    e.path = tmp.path / "deleted.txt";
    e.size = 3;
    auto rec = read_file_record(e, AggregateOptions{});
    REQUIRE(std::get<Skipped>(rec.disposition).reason == SkipReason::ReadError);
}

// ---- End to end ----

TEST_CASE("hidden, oversized and text files", "[aggregator]") {
    TempDir tmp("agg");
    tmp.write_file("a.txt", "0123456789");
    tmp.write_file(".hidden/b.txt", "bee\n");
    std::string big = binary_payload(600 * 1024);
    tmp.write_file("big.bin", big);

    SECTION("defaults") {
        auto r = run_ok({tmp.path}, AggregateOptions{});
        REQUIRE(r.output == block(tmp.path / "a.txt", "0123456789"));
        REQUIRE(r.stats.files_processed == 1);
        REQUIRE(r.stats.text_files == 1);
        REQUIRE(r.stats.skipped(SkipReason::Oversized) == 1);
        REQUIRE(r.stats.dirs_skipped(SkipReason::Hidden) == 1);
        REQUIRE(r.stats.directories_visited == 1);
        REQUIRE(r.stats.output_bytes == r.output.size());
        REQUIRE_FALSE(r.truncated());
    }

    SECTION("--all keeps the per-file ceiling") {
        AggregateOptions opts;
        opts.include_all = true;
        auto r = run_ok({tmp.path}, opts);
        REQUIRE(r.output == block(tmp.path / "a.txt", "0123456789") +
                            block(tmp.path / ".hidden" / "b.txt", "bee\n"));
        REQUIRE(r.stats.skipped(SkipReason::Oversized) == 1);
        REQUIRE(r.stats.directories_visited == 2);
    }

    SECTION("--all with a larger file ceiling embeds the binary") {
        AggregateOptions opts;
        opts.include_all = true;
        opts.max_file_size = kMiB;
        auto r = run_ok({tmp.path}, opts);
        REQUIRE(r.stats.files_processed == 3);
        REQUIRE(r.stats.binary_files == 1);

        std::string marker = "--- " + (tmp.path / "big.bin").generic_string() +
                             " ---\n<BINARY_FILE base64 " + std::to_string(big.size()) + " bytes>\n";
        auto start = r.output.find(marker);
        REQUIRE(start != std::string::npos);
        start += marker.size();
        auto end = r.output.find("\n\n", start);
        REQUIRE(end != std::string::npos);
        auto decoded = base64_decode(r.output.substr(start, end - start + 1));
        REQUIRE(decoded.is_ok());
        REQUIRE(decoded.value() == big);
    }
}

TEST_CASE("binary files become markers by default", "[aggregator]") {
    TempDir tmp("agg");
    tmp.write_file("logo.png", binary_payload(2000));
    tmp.write_file("notes.md", "# notes\n");

    auto r = run_ok({tmp.path}, AggregateOptions{});
    REQUIRE(r.output == block(tmp.path / "logo.png", "<BINARY_FILE>\n") +
                        block(tmp.path / "notes.md", "# notes\n"));
    REQUIRE(r.stats.binary_files == 1);
    REQUIRE(r.stats.skipped(SkipReason::Binary) == 1);
    REQUIRE(r.stats.files_processed == 1);
}

TEST_CASE("exclude patterns apply with and without --all", "[aggregator]") {
    TempDir tmp("agg");
    tmp.write_file("x.log", "log line\n");
    tmp.write_file("x.txt", "text\n");

    AggregateOptions opts;
    opts.exclude_patterns = {"*.log"};
    auto r = run_ok({tmp.path}, opts);
    REQUIRE(r.output == block(tmp.path / "x.txt", "text\n"));
    REQUIRE(r.stats.skipped(SkipReason::Excluded) == 1);

    opts.include_all = true;
    auto all = run_ok({tmp.path}, opts);
    REQUIRE(all.output == r.output);
}

TEST_CASE("total ceiling stops at the first file that does not fit", "[aggregator]") {
    TempDir tmp("agg");
    std::string sixty(59, 'x');
    sixty += '\n';
    tmp.write_file("f1.txt", sixty);
    tmp.write_file("f2.txt", sixty);
    tmp.write_file("f3.txt", sixty);
    auto b1 = block(tmp.path / "f1.txt", sixty);
    auto b2 = block(tmp.path / "f2.txt", sixty);

    SECTION("second block overflows") {
        AggregateOptions opts;
        opts.max_total_size = b1.size() + b2.size() / 2;
        auto r = run_ok({tmp.path}, opts);
        REQUIRE(r.output == b1);
        REQUIRE(r.output.size() <= opts.max_total_size);
        REQUIRE(r.stats.files_processed == 1);
        REQUIRE(r.stats.skipped(SkipReason::Budget) == 2);
        REQUIRE(r.truncated());
    }

    SECTION("exact fit is included") {
        AggregateOptions opts;
        opts.max_total_size = b1.size() + b2.size();
        auto r = run_ok({tmp.path}, opts);
        REQUIRE(r.output == b1 + b2);
        REQUIRE(r.output.size() == opts.max_total_size);
        REQUIRE(r.stats.files_processed == 2);
        REQUIRE(r.stats.skipped(SkipReason::Budget) == 1);
    }

    SECTION("one byte short is not") {
        AggregateOptions opts;
        opts.max_total_size = b1.size() + b2.size() - 1;
        auto r = run_ok({tmp.path}, opts);
        REQUIRE(r.output == b1);
        REQUIRE(r.stats.skipped(SkipReason::Budget) == 2);
    }

    SECTION("nothing fits") {
        AggregateOptions opts;
        opts.max_total_size = 10;
        auto r = run_ok({tmp.path}, opts);
        REQUIRE(r.output.empty());
        REQUIRE(r.stats.files_processed == 0);
        REQUIRE(r.stats.skipped(SkipReason::Budget) == 3);
    }
}

TEST_CASE("per-file ceiling is inclusive", "[aggregator]") {
    TempDir tmp("agg");
    const uint64_t limit = kClassifyWindow + 1000;
    std::string exact(limit - 1, 'e');
    exact += '\n';
    tmp.write_file("exact.txt", exact);
    tmp.write_file("over.txt", std::string(limit + 1, 'o'));

    AggregateOptions opts;
    opts.max_file_size = limit;
    for (unsigned threads : {1u, 4u}) {
        opts.threads = threads;
        auto r = run_ok({tmp.path}, opts);
        INFO("threads: " << threads);
        REQUIRE(r.output == block(tmp.path / "exact.txt", exact));
        REQUIRE(r.stats.files_processed == 1);
        REQUIRE(r.stats.skipped(SkipReason::Oversized) == 1);
    }
}

TEST_CASE("ignored directory contents with one file kept", "[aggregator]") {
    TempDir tmp("agg");
    tmp.write_file(".gitignore", "logs/**\n!logs/keep.txt\n");
    tmp.write_file("logs/keep.txt", "keep\n");
    tmp.write_file("logs/drop.txt", "drop\n");

    auto r = run_ok({tmp.path}, AggregateOptions{});
    REQUIRE(r.output == block(tmp.path / "logs" / "keep.txt", "keep\n"));
    REQUIRE(r.stats.skipped(SkipReason::Ignored) == 1);
}

TEST_CASE("nested gitignore negation end to end", "[aggregator]") {
    TempDir tmp("agg");
    tmp.write_file(".gitignore", "*.log\n");
    tmp.write_file("sub/.gitignore", "!important.log\n");
    tmp.write_file("sub/important.log", "keep me\n");
    tmp.write_file("sub/debug.log", "drop me\n");

    auto r = run_ok({tmp.path}, AggregateOptions{});
    REQUIRE(r.output == block(tmp.path / "sub" / "important.log", "keep me\n"));
    REQUIRE(r.stats.ignore_files.size() == 2);
    REQUIRE(r.stats.skipped(SkipReason::Ignored) == 1);
}

TEST_CASE("every file filtered is still a success", "[aggregator]") {
    TempDir tmp("agg");
    tmp.write_file(".a", "x");
    tmp.write_file(".b/c.txt", "x");

    auto r = run_ok({tmp.path}, AggregateOptions{});
    REQUIRE(r.output.empty());
    REQUIRE(r.stats.files_processed == 0);
    REQUIRE(r.stats.skipped(SkipReason::Hidden) == 1);
    REQUIRE(r.stats.dirs_skipped(SkipReason::Hidden) == 1);
}

static void build_wide_tree(TempDir& tmp) {
    for (int d = 0; d < 6; ++d) {
        std::string dir = "dir" + std::to_string(d);
        for (int f = 0; f < 12; ++f) {
            std::string name = dir + "/file" + std::to_string(f) + ".txt";
            tmp.write_file(name, std::string(40 + d * 13 + f * 7, static_cast<char>('a' + f)) + "\n");
        }
        tmp.write_file(dir + "/nested/deep.md", "deep " + dir + "\n");
        tmp.write_file(dir + "/blob.bin", binary_payload(300 + d));
        tmp.write_file(dir + "/.secret", "hidden\n");
    }
    tmp.write_file("huge.txt", std::string(3000, 'h'));
}

TEST_CASE("output is independent of the thread count", "[aggregator]") {
    TempDir tmp("agg");
    build_wide_tree(tmp);

    AggregateOptions opts;
    opts.max_file_size = 2000;
    opts.max_total_size = 4000;

    opts.threads = 1;
    auto single = run_ok({tmp.path}, opts);
    REQUIRE(single.truncated());
    REQUIRE(single.stats.skipped(SkipReason::Oversized) == 1);

    for (unsigned threads : {2u, 8u, 16u}) {
        opts.threads = threads;
        auto multi = run_ok({tmp.path}, opts);
        INFO("threads: " << threads);
        REQUIRE(multi.output == single.output);
        REQUIRE(multi.stats.same_counts(single.stats));
    }
}

TEST_CASE("repeated runs are identical", "[aggregator]") {
    TempDir tmp("agg");
    build_wide_tree(tmp);

    AggregateOptions opts;
    opts.threads = 4;
    auto first = run_ok({tmp.path}, opts);
    auto second = run_ok({tmp.path}, opts);
    REQUIRE_FALSE(first.truncated());
    REQUIRE(first.output == second.output);
    REQUIRE(first.stats.same_counts(second.stats));
    REQUIRE(first.stats.files_processed == 6 * 13 + 1);
    REQUIRE(first.stats.binary_files == 6);
}

TEST_CASE("multiple roots keep argument order", "[aggregator]") {
    TempDir tmp("agg");
    tmp.write_file("one/a.txt", "a\n");
    tmp.write_file("two/b.txt", "b\n");
    auto single = tmp.write_file("c.txt", "c\n");

    auto r = run_ok({tmp.path / "two", single, tmp.path / "one"}, AggregateOptions{});
    REQUIRE(r.output == block(tmp.path / "two" / "b.txt", "b\n") +
                        block(single, "c\n") +
                        block(tmp.path / "one" / "a.txt", "a\n"));
    REQUIRE(r.roots_ok == 3);
}

TEST_CASE("overlapping roots emit each file once", "[aggregator]") {
    TempDir tmp("agg");
    tmp.write_file("a.txt", "a\n");
    tmp.write_file("sub/b.txt", "b\n");

    auto r = run_ok({tmp.path, tmp.path / "sub"}, AggregateOptions{});
    REQUIRE(r.output == block(tmp.path / "a.txt", "a\n") +
                        block(tmp.path / "sub" / "b.txt", "b\n"));
    REQUIRE(r.stats.dirs_skipped(SkipReason::Duplicate) == 1);
}

TEST_CASE("a missing root does not stop the others", "[aggregator]") {
    TempDir tmp("agg");
    tmp.write_file("a.txt", "a\n");

    log::set_level(log::Info);
    log::set_color_enabled(false);
    AggregateResult r;
    auto logged = capture_stderr([&] {
        r = run_ok({tmp.path / "missing", tmp.path}, AggregateOptions{});
    });
    REQUIRE(logged.find("error[NotFound]") != std::string::npos);
    REQUIRE(r.output == block(tmp.path / "a.txt", "a\n"));
    REQUIRE(r.roots_ok == 1);
    REQUIRE(r.root_errors.size() == 1);
    REQUIRE(r.root_errors[0].code == RcatError::NotFound);
}

TEST_CASE("all roots missing is an error", "[aggregator]") {
    TempDir tmp("agg");
    log::set_level(log::Info);
    log::set_color_enabled(false);
    Result<AggregateResult> r = RcatError{};
    auto logged = capture_stderr([&] {
        r = aggregate({tmp.path / "nope", tmp.path / "nada"}, AggregateOptions{});
    });
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == RcatError::NotFound);
    // Reported once, through the returned error only
    REQUIRE(logged.find("does not exist") == std::string::npos);
    REQUIRE(r.error().hint.find("nope") != std::string::npos);
    REQUIRE(r.error().hint.find("nada") != std::string::npos);

    auto none = aggregate({}, AggregateOptions{});
    REQUIRE(none.is_err());
    REQUIRE(none.error().code == RcatError::InvalidArg);
}
