#pragma once

#include <rcat/entry.hpp>
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace rcat {

// Run counters. Owned by the aggregation context and only mutated under its
// lock; read once when the run finishes.
struct Statistics {
    uint64_t files_processed = 0;   // files whose content is in the output
    uint64_t text_files = 0;
    uint64_t binary_files = 0;      // classified Binary, marked or embedded
    uint64_t read_errors = 0;
    uint64_t directories_visited = 0;
    uint64_t output_bytes = 0;
    bool truncated = false;

    std::map<SkipReason, uint64_t> skipped_files;
    std::map<SkipReason, uint64_t> skipped_dirs;
    std::vector<std::string> ignore_files;
    std::map<std::string, uint64_t> extensions;  // lower-case, without '.'

    std::chrono::steady_clock::duration elapsed{};

    void record_skip(const PathEntry& entry, SkipReason reason);
    void record_extension(const std::string& path);

    uint64_t skipped(SkipReason reason) const;
    uint64_t dirs_skipped(SkipReason reason) const;
    uint64_t total_skipped_files() const;
    uint64_t total_skipped_dirs() const;

    // Equal counters, ignoring elapsed time.
    bool same_counts(const Statistics& other) const;

    // Multi-line human readable summary.
    std::string summary() const;
};

} // namespace rcat
