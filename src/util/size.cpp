#include <rcat/size.hpp>
#include <cctype>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace rcat {

static std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) b++;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) e--;
    return s.substr(b, e - b);
}

Result<uint64_t> parse_size(const std::string& text) {
    std::string s = trim(text);
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

    size_t unit_pos = 0;
    while (unit_pos < s.size() && !std::isalpha(static_cast<unsigned char>(s[unit_pos]))) {
        unit_pos++;
    }
    std::string number = trim(s.substr(0, unit_pos));
    std::string unit = trim(s.substr(unit_pos));

    if (number.empty()) {
        return RcatError{RcatError::InvalidArg, "invalid size '" + text + "': missing number"};
    }
    if (number[0] == '-') {
        return RcatError{RcatError::InvalidArg, "invalid size '" + text + "': size cannot be negative"};
    }

    const char* begin = number.c_str();
    char* end = nullptr;
    double value = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || !std::isfinite(value)) {
        return RcatError{RcatError::InvalidArg, "invalid size '" + text + "': bad number '" + number + "'"};
    }

    uint64_t multiplier = 0;
    if (unit.empty() || unit == "B") {
        multiplier = 1;
    } else if (unit == "K" || unit == "KB") {
        multiplier = kKiB;
    } else if (unit == "M" || unit == "MB") {
        multiplier = kMiB;
    } else if (unit == "G" || unit == "GB") {
        multiplier = kGiB;
    } else {
        return RcatError{RcatError::InvalidArg,
            "invalid size '" + text + "': unknown unit '" + unit + "'",
            "use B, KB, MB or GB"};
    }

    double bytes = value * static_cast<double>(multiplier);
    if (bytes >= 18446744073709551615.0) {
        return RcatError{RcatError::InvalidArg, "invalid size '" + text + "': too large"};
    }
    auto size = static_cast<uint64_t>(bytes);
    if (size == 0) {
        return RcatError{RcatError::InvalidArg, "invalid size '" + text + "': size must be greater than 0"};
    }
    return Result<uint64_t>::ok(size);
}

std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    if (bytes == 0) return "0 B";

    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit < 4) {
        size /= 1024.0;
        unit++;
    }

    char buf[64];
    if (size == std::floor(size)) {
        std::snprintf(buf, sizeof(buf), "%.0f %s", size, units[unit]);
    } else if (size < 10.0) {
        std::snprintf(buf, sizeof(buf), "%.2f %s", size, units[unit]);
    } else if (size < 100.0) {
        std::snprintf(buf, sizeof(buf), "%.1f %s", size, units[unit]);
    } else {
        std::snprintf(buf, sizeof(buf), "%.0f %s", size, units[unit]);
    }
    return buf;
}

std::string format_as_unit(uint64_t bytes) {
    if (bytes >= kGiB && bytes % kGiB == 0) return std::to_string(bytes / kGiB) + "GB";
    if (bytes >= kMiB && bytes % kMiB == 0) return std::to_string(bytes / kMiB) + "MB";
    if (bytes >= kKiB && bytes % kKiB == 0) return std::to_string(bytes / kKiB) + "KB";
    return std::to_string(bytes) + " bytes";
}

} // namespace rcat
