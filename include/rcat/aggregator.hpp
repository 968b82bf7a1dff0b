#pragma once

#include <rcat/classify.hpp>
#include <rcat/entry.hpp>
#include <rcat/result.hpp>
#include <rcat/size.hpp>
#include <rcat/stats.hpp>
#include <cstdint>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace rcat {

// Marker line written in place of binary content.
inline constexpr const char* kBinaryMarker = "<BINARY_FILE>";

// Width of base64 lines for embedded binary content.
constexpr size_t kBase64LineWidth = 76;

struct AggregateOptions {
    bool include_all = false;
    uint64_t max_total_size = kDefaultMaxSize;
    uint64_t max_file_size = kDefaultMaxFileSize;
    std::vector<std::string> exclude_patterns;
    unsigned threads = 0;   // 0 = WorkerPool::resolve_thread_count default
};

// ---- File disposition ----

struct IncludedText {
    std::string content;
};

struct MarkedBinary {};

struct EmbeddedBinary {
    std::string encoded;   // base64, wrapped at kBase64LineWidth
    uint64_t raw_size = 0;
};

struct Skipped {
    SkipReason reason;
    std::string detail;
};

using Disposition = std::variant<IncludedText, MarkedBinary, EmbeddedBinary, Skipped>;

struct FileRecord {
    std::string path;   // display path
    uint64_t size = 0;
    Classification classification = Classification::Text;
    Disposition disposition;
};

// Read and classify one candidate. Never fails: problems become a Skipped
// disposition. Files listed above `max_file_size` are not opened.
FileRecord read_file_record(const PathEntry& candidate, const AggregateOptions& options);

// The output block for a record: header line, content or marker, blank
// separator line. Empty for Skipped records.
std::string format_record(const FileRecord& record);

// ---- Budget ----

struct SizeBudget {
    uint64_t file_limit = kDefaultMaxFileSize;
    uint64_t total_limit = kDefaultMaxSize;
    uint64_t total_used = 0;

    bool file_fits(uint64_t file_size) const { return file_size <= file_limit; }
    uint64_t remaining() const { return total_limit - total_used; }

    // Charge `bytes` against the total; false (and no change) if it would overflow.
    bool try_consume(uint64_t bytes);
};

// ---- Run ----

struct AggregateResult {
    std::string output;
    Statistics stats;
    std::vector<RcatError> root_errors;   // one per failed root
    size_t roots_ok = 0;

    bool truncated() const { return stats.truncated; }
};

class Aggregator {
public:
    explicit Aggregator(AggregateOptions options);

    // Walk every root in order and assemble the output. Fails only when no
    // root could be opened; individual root failures are in root_errors.
    Result<AggregateResult> run(const std::vector<std::filesystem::path>& roots);

    const AggregateOptions& options() const { return options_; }

private:
    AggregateOptions options_;
};

// Convenience wrapper: Aggregator(options).run(roots).
Result<AggregateResult> aggregate(const std::vector<std::filesystem::path>& roots,
                                  const AggregateOptions& options);

} // namespace rcat
