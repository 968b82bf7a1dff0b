#include <rcat/base64.hpp>
#include <cstdint>

namespace rcat {

static constexpr char kAlphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static int decode_char(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

std::string base64_encode(const std::string& bytes, size_t line_width) {
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4 + 2);

    size_t col = 0;
    auto put = [&](char c) {
        out.push_back(c);
        if (line_width > 0 && ++col == line_width) {
            out.push_back('\n');
            col = 0;
        }
    };

    size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        uint32_t v = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8) |
                     static_cast<uint8_t>(bytes[i + 2]);
        put(kAlphabet[(v >> 18) & 0x3F]);
        put(kAlphabet[(v >> 12) & 0x3F]);
        put(kAlphabet[(v >> 6) & 0x3F]);
        put(kAlphabet[v & 0x3F]);
    }

    size_t rest = bytes.size() - i;
    if (rest == 1) {
        uint32_t v = static_cast<uint8_t>(bytes[i]) << 16;
        put(kAlphabet[(v >> 18) & 0x3F]);
        put(kAlphabet[(v >> 12) & 0x3F]);
        put('=');
        put('=');
    } else if (rest == 2) {
        uint32_t v = (static_cast<uint8_t>(bytes[i]) << 16) |
                     (static_cast<uint8_t>(bytes[i + 1]) << 8);
        put(kAlphabet[(v >> 18) & 0x3F]);
        put(kAlphabet[(v >> 12) & 0x3F]);
        put(kAlphabet[(v >> 6) & 0x3F]);
        put('=');
    }

    // Terminate a partial last line.
    if (line_width > 0 && col != 0) out.push_back('\n');
    return out;
}

Result<std::string> base64_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size() / 4 * 3);

    uint32_t acc = 0;
    int bits = 0;
    size_t padding = 0;
    size_t symbols = 0;

    for (char c : text) {
        if (c == '\n' || c == '\r') continue;
        if (c == '=') {
            padding++;
            symbols++;
            continue;
        }
        if (padding > 0) {
            return RcatError{RcatError::Parse, "base64: data after padding"};
        }
        int v = decode_char(c);
        if (v < 0) {
            return RcatError{RcatError::Parse,
                std::string("base64: invalid character '") + c + "'"};
        }
        symbols++;
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<char>((acc >> bits) & 0xFF));
        }
    }

    if (symbols % 4 != 0 || padding > 2) {
        return RcatError{RcatError::Parse, "base64: truncated input"};
    }
    return Result<std::string>::ok(std::move(out));
}

} // namespace rcat
