#include <rcat/classify.hpp>
#include <cstdint>

namespace rcat {

static bool is_text_control(uint8_t b) {
    switch (b) {
        case '\t': case '\n': case '\v': case '\f': case '\r':
        case 0x08:  // backspace
        case 0x1B:  // escape, used by coloured logs
            return true;
        default:
            return false;
    }
}

// Length of the UTF-8 sequence introduced by `lead`, or 0 if `lead` cannot
// start one.
static size_t utf8_sequence_length(uint8_t lead) {
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 0;
}

Classification classify(const char* data, size_t len) {
    if (len > kClassifyWindow) len = kClassifyWindow;
    if (len == 0) return Classification::Text;

    const auto* bytes = reinterpret_cast<const uint8_t*>(data);
    size_t suspicious = 0;

    size_t i = 0;
    while (i < len) {
        uint8_t b = bytes[i];

        if (b == 0) return Classification::Binary;

        if (b < 0x80) {
            if ((b < 0x20 && !is_text_control(b)) || b == 0x7F) suspicious++;
            i++;
            continue;
        }

        size_t need = utf8_sequence_length(b);
        if (need == 0) {
            suspicious++;
            i++;
            continue;
        }

        // Sequence cut off by the window end: not evidence either way.
        if (i + need > len) {
            bool prefix_ok = true;
            for (size_t k = i + 1; k < len; k++) {
                if ((bytes[k] & 0xC0) != 0x80) prefix_ok = false;
            }
            if (!prefix_ok) suspicious += len - i;
            break;
        }

        bool valid = true;
        for (size_t k = 1; k < need; k++) {
            if ((bytes[i + k] & 0xC0) != 0x80) {
                valid = false;
                break;
            }
        }
        // Reject overlongs and surrogates that the lead-byte ranges let through.
        if (valid && b == 0xE0 && bytes[i + 1] < 0xA0) valid = false;
        if (valid && b == 0xED && bytes[i + 1] > 0x9F) valid = false;
        if (valid && b == 0xF0 && bytes[i + 1] < 0x90) valid = false;
        if (valid && b == 0xF4 && bytes[i + 1] > 0x8F) valid = false;

        if (valid) {
            i += need;
        } else {
            suspicious++;
            i++;
        }
    }

    double ratio = static_cast<double>(suspicious) / static_cast<double>(len);
    return ratio > kBinaryRatioThreshold ? Classification::Binary : Classification::Text;
}

Classification classify(const std::string& prefix) {
    return classify(prefix.data(), prefix.size());
}

const char* classification_name(Classification c) {
    switch (c) {
        case Classification::Text:   return "text";
        case Classification::Binary: return "binary";
    }
    return "unknown";
}

} // namespace rcat
