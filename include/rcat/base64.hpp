#pragma once

#include <rcat/result.hpp>
#include <cstddef>
#include <string>

namespace rcat {

// RFC 4648 base64 with '=' padding. When `line_width` is non-zero the output
// is split into lines of that many characters, each terminated by '\n'.
std::string base64_encode(const std::string& bytes, size_t line_width = 0);

// Inverse of base64_encode. Line breaks are skipped; any other character
// outside the alphabet, or bad padding, is a Parse error.
Result<std::string> base64_decode(const std::string& text);

} // namespace rcat
