#pragma once

#include <cstddef>
#include <string>

namespace rcat {

enum class Classification { Text, Binary };

// Bytes examined from the start of a file.
constexpr size_t kClassifyWindow = 8192;

// Fraction of suspicious bytes above which a window is Binary.
constexpr double kBinaryRatioThreshold = 0.30;

// Classify the leading bytes of a file. Only the first kClassifyWindow bytes
// of `prefix` are examined. A NUL byte is always Binary; otherwise control
// bytes and invalid UTF-8 count against the threshold. Empty input is Text.
Classification classify(const char* data, size_t len);
Classification classify(const std::string& prefix);

const char* classification_name(Classification c);

} // namespace rcat
