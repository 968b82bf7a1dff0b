#pragma once

#include <rcat/result.hpp>
#include <cstdint>
#include <string>

namespace rcat {

constexpr uint64_t kKiB = 1024;
constexpr uint64_t kMiB = 1024 * kKiB;
constexpr uint64_t kGiB = 1024 * kMiB;

// Default total-output ceiling and per-file ceiling.
constexpr uint64_t kDefaultMaxSize = 5 * kMiB;
constexpr uint64_t kDefaultMaxFileSize = 500 * kKiB;

// Parse a human-readable size such as "500KB", "1.5M", " 10 mb " or "4096".
// Units are powers of 1024: B, K/KB, M/MB, G/GB. Zero, negative and
// malformed sizes are InvalidArg errors.
Result<uint64_t> parse_size(const std::string& text);

// "0 B", "512 B", "1 KB", "1.50 KB", "12.5 MB", "320 KB"
std::string format_bytes(uint64_t bytes);

// "5MB", "500KB", "1GB"; sizes that are not a whole unit fall back to "N bytes".
std::string format_as_unit(uint64_t bytes);

} // namespace rcat
