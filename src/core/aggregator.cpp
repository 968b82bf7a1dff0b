#include <rcat/aggregator.hpp>
#include <rcat/base64.hpp>
#include <rcat/ignore.hpp>
#include <rcat/log.hpp>
#include <rcat/thread_pool.hpp>
#include <rcat/walker.hpp>
#include <algorithm>
#include <condition_variable>
#include <exception>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>

namespace fs = std::filesystem;

namespace rcat {

// ---- Reading ----

static FileRecord skipped_record(FileRecord rec, SkipReason reason, std::string detail) {
    rec.disposition = Skipped{reason, std::move(detail)};
    return rec;
}

FileRecord read_file_record(const PathEntry& candidate, const AggregateOptions& options) {
    FileRecord rec;
    rec.path = candidate.display();
    rec.size = candidate.size;

    if (candidate.size > options.max_file_size) {
        return skipped_record(std::move(rec), SkipReason::Oversized,
            format_bytes(candidate.size) + " exceeds " + format_as_unit(options.max_file_size));
    }

    std::ifstream in(candidate.path, std::ios::binary);
    if (!in.is_open()) {
        log::warn("cannot open %s", rec.path.c_str());
        return skipped_record(std::move(rec), SkipReason::ReadError, "cannot open file");
    }

    std::string content(kClassifyWindow, '\0');
    in.read(&content[0], static_cast<std::streamsize>(content.size()));
    content.resize(static_cast<size_t>(in.gcount()));
    if (in.bad()) {
        log::warn("read failed for %s", rec.path.c_str());
        return skipped_record(std::move(rec), SkipReason::ReadError, "read failed");
    }

    rec.classification = classify(content);
    if (rec.classification == Classification::Binary && !options.include_all) {
        rec.disposition = MarkedBinary{};
        return rec;
    }

    // Read the rest, never more than one byte past the per-file ceiling.
    const uint64_t limit = options.max_file_size + 1;
    char buf[64 * 1024];
    while (in && content.size() < limit) {
        auto want = std::min<uint64_t>(sizeof(buf), limit - content.size());
        in.read(buf, static_cast<std::streamsize>(want));
        content.append(buf, static_cast<size_t>(in.gcount()));
    }
    if (in.bad()) {
        log::warn("read failed for %s", rec.path.c_str());
        return skipped_record(std::move(rec), SkipReason::ReadError, "read failed");
    }

    if (content.size() > options.max_file_size) {
        return skipped_record(std::move(rec), SkipReason::Oversized,
            "grew past " + format_as_unit(options.max_file_size) + " while reading");
    }

    rec.size = content.size();
    if (rec.classification == Classification::Binary) {
        rec.disposition = EmbeddedBinary{base64_encode(content, kBase64LineWidth), rec.size};
    } else {
        rec.disposition = IncludedText{std::move(content)};
    }
    return rec;
}

// ---- Formatting ----

namespace {

struct BlockFormatter {
    const std::string& header;

    std::string operator()(const IncludedText& t) const {
        std::string block = header;
        block += t.content;
        if (!t.content.empty() && t.content.back() != '\n') block += '\n';
        block += '\n';
        return block;
    }

    std::string operator()(const MarkedBinary&) const {
        return header + kBinaryMarker + "\n\n";
    }

    std::string operator()(const EmbeddedBinary& b) const {
        return header + "<BINARY_FILE base64 " + std::to_string(b.raw_size) + " bytes>\n" +
               b.encoded + "\n";
    }

    std::string operator()(const Skipped&) const {
        return {};
    }
};

} // namespace

std::string format_record(const FileRecord& record) {
    std::string header = "--- " + record.path + " ---\n";
    return std::visit(BlockFormatter{header}, record.disposition);
}

// ---- Budget ----

bool SizeBudget::try_consume(uint64_t bytes) {
    if (bytes > remaining()) return false;
    total_used += bytes;
    return true;
}

// ---- Aggregation context ----

namespace {

// Shared state between the coordinator and the workers' completion handler.
// Completed records wait in a reorder buffer keyed by traversal sequence
// number; the coordinator emits them strictly in sequence, charging the
// budget and updating statistics under the same lock.
class AggregationContext {
public:
    explicit AggregationContext(const AggregateOptions& options) {
        budget_.file_limit = options.max_file_size;
        budget_.total_limit = options.max_total_size;
    }

    // Worker side.
    void complete(uint64_t seq, FileRecord rec) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ready_.emplace(seq, std::move(rec));
            --in_flight_;
        }
        cv_.notify_all();
    }

    // Coordinator side.
    void dispatched() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++in_flight_;
    }

    void post(uint64_t seq, FileRecord rec) {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_.emplace(seq, std::move(rec));
        emit_ready_locked();
    }

    void await_capacity(size_t max_in_flight) {
        std::unique_lock<std::mutex> lock(mutex_);
        emit_ready_locked();
        cv_.wait(lock, [&] { return in_flight_ < max_in_flight; });
        emit_ready_locked();
    }

    void finish() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [&] { return in_flight_ == 0; });
        emit_ready_locked();
    }

    bool exhausted() {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_.truncated;
    }

    void record_skip(const PathEntry& entry, SkipReason reason) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.record_skip(entry, reason);
    }

    void record_directory() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.directories_visited;
    }

    void record_ignore_file(const fs::path& file) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.ignore_files.push_back(file.generic_string());
    }

    void take(std::string& output, Statistics& stats) {
        std::lock_guard<std::mutex> lock(mutex_);
        output = std::move(output_);
        stats = std::move(stats_);
    }

private:
    void emit_ready_locked() {
        for (auto it = ready_.find(next_seq_); it != ready_.end(); it = ready_.find(next_seq_)) {
            apply_locked(it->second);
            ready_.erase(it);
            ++next_seq_;
        }
    }

    void apply_locked(const FileRecord& rec) {
        if (stats_.truncated) {
            stats_.skipped_files[SkipReason::Budget]++;
            return;
        }

        if (const auto* s = std::get_if<Skipped>(&rec.disposition)) {
            if (s->reason == SkipReason::ReadError) stats_.read_errors++;
            stats_.skipped_files[s->reason]++;
            log::debug("skip %s (%s: %s)", rec.path.c_str(),
                       skip_reason_name(s->reason), s->detail.c_str());
            return;
        }

        std::string block = format_record(rec);
        if (!budget_.try_consume(block.size())) {
            stats_.truncated = true;
            stats_.skipped_files[SkipReason::Budget]++;
            log::info("total size limit of %s reached at %s (%s collected)",
                      format_as_unit(budget_.total_limit).c_str(), rec.path.c_str(),
                      format_bytes(budget_.total_used).c_str());
            return;
        }

        output_ += block;
        stats_.output_bytes += block.size();
        stats_.record_extension(rec.path);

        if (std::holds_alternative<IncludedText>(rec.disposition)) {
            stats_.files_processed++;
            stats_.text_files++;
        } else if (std::holds_alternative<EmbeddedBinary>(rec.disposition)) {
            stats_.files_processed++;
            stats_.binary_files++;
        } else {
            stats_.binary_files++;
            stats_.skipped_files[SkipReason::Binary]++;
        }
    }

    std::mutex mutex_;
    std::condition_variable cv_;
    std::map<uint64_t, FileRecord> ready_;
    uint64_t next_seq_ = 0;
    size_t in_flight_ = 0;
    SizeBudget budget_;
    Statistics stats_;
    std::string output_;
};

} // namespace

// ---- Aggregator ----

Aggregator::Aggregator(AggregateOptions options)
    : options_(std::move(options)) {}

Result<AggregateResult> Aggregator::run(const std::vector<fs::path>& roots) {
    if (roots.empty()) {
        return RcatError{RcatError::InvalidArg, "no input paths given"};
    }

    auto start = std::chrono::steady_clock::now();

    IgnoreResolver resolver(options_.exclude_patterns, options_.include_all);
    AggregationContext ctx(options_);
    VisitedSet visited;

    const unsigned threads = WorkerPool::resolve_thread_count(options_.threads);
    const size_t max_in_flight = static_cast<size_t>(threads) * 4;
    log::debug("reading with %u worker thread(s)", threads);

    WalkCallbacks callbacks;
    callbacks.directory_visited = [&ctx](const PathEntry&) { ctx.record_directory(); };
    callbacks.skipped = [&ctx](const PathEntry& e, SkipReason r) { ctx.record_skip(e, r); };
    callbacks.ignore_file_loaded = [&ctx](const fs::path& f) { ctx.record_ignore_file(f); };

    AggregateResult result;
    // Walkers own the parent entries referenced by in-flight candidates.
    std::vector<std::unique_ptr<Walker>> walkers;
    uint64_t seq = 0;

    {
        WorkerPool pool(threads);

        for (size_t i = 0; i < roots.size(); i++) {
            auto walker = std::make_unique<Walker>(roots[i], i, resolver, visited, callbacks);
            auto status = walker->open();
            if (status.is_err()) {
                result.root_errors.push_back(std::move(status).error());
                continue;
            }
            result.roots_ok++;

            while (auto candidate = walker->next()) {
                if (ctx.exhausted()) {
                    // Budget spent: keep counting, stop reading.
                    ctx.record_skip(*candidate, SkipReason::Budget);
                    continue;
                }

                const uint64_t id = seq++;
                if (candidate->size > options_.max_file_size) {
                    ctx.post(id, read_file_record(*candidate, options_));
                    continue;
                }

                ctx.await_capacity(max_in_flight);
                ctx.dispatched();
                pool.submit([this, &ctx, id, entry = std::move(*candidate)] {
                    FileRecord rec;
                    try {
                        rec = read_file_record(entry, options_);
                    } catch (const std::exception& e) {
                        log::warn("failed to read %s: %s", entry.display().c_str(), e.what());
                        rec.path = entry.display();
                        rec.size = entry.size;
                        rec.disposition = Skipped{SkipReason::ReadError, e.what()};
                    }
                    ctx.complete(id, std::move(rec));
                });
            }
            walkers.push_back(std::move(walker));
        }

        ctx.finish();
    }

    // All roots failed: one combined error for the caller to report.
    if (result.roots_ok == 0) {
        std::string detail;
        for (const auto& err : result.root_errors) {
            if (!detail.empty()) detail += "; ";
            detail += err.message;
        }
        return RcatError{result.root_errors.front().code,
            "none of the " + std::to_string(roots.size()) + " input path(s) could be read",
            detail};
    }

    for (const auto& err : result.root_errors) {
        log::error("%s", err.format().c_str());
    }

    ctx.take(result.output, result.stats);
    result.stats.elapsed = std::chrono::steady_clock::now() - start;
    return Result<AggregateResult>::ok(std::move(result));
}

Result<AggregateResult> aggregate(const std::vector<fs::path>& roots,
                                  const AggregateOptions& options) {
    return Aggregator(options).run(roots);
}

} // namespace rcat
