#include <sguid/base64.hpp>
#include <array>

namespace sguid::base64 {

static const char alphabet[] =
    "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

static constexpr int PAD = -2;
static constexpr int BAD = -1;

static std::array<int, 256> build_decode_table() {
    std::array<int, 256> table;
    table.fill(BAD);
    for (int i = 0; i < 64; ++i) {
        table[static_cast<unsigned char>(alphabet[i])] = i;
    }
    table[static_cast<unsigned char>('=')] = PAD;
    return table;
}

static const std::array<int, 256> decode_table = build_decode_table();

std::string encode(const uint8_t* data, size_t len) {
    std::string out;
    out.reserve(((len + 2) / 3) * 4);

    size_t i = 0;
    while (i + 2 < len) {
        uint32_t triple = (static_cast<uint32_t>(data[i]) << 16) |
                          (static_cast<uint32_t>(data[i + 1]) << 8) |
                          static_cast<uint32_t>(data[i + 2]);
        i += 3;
        out += alphabet[(triple >> 18) & 0x3F];
        out += alphabet[(triple >> 12) & 0x3F];
        out += alphabet[(triple >> 6) & 0x3F];
        out += alphabet[triple & 0x3F];
    }

    // 1 or 2 trailing bytes
    if (i < len) {
        uint32_t rest = static_cast<uint32_t>(data[i]) << 16;
        bool two = (i + 1 < len);
        if (two) rest |= static_cast<uint32_t>(data[i + 1]) << 8;
        out += alphabet[(rest >> 18) & 0x3F];
        out += alphabet[(rest >> 12) & 0x3F];
        out += two ? alphabet[(rest >> 6) & 0x3F] : '=';
        out += '=';
    }
    return out;
}

Result<std::vector<uint8_t>> decode(const std::string& text) {
    if (text.size() % 4 != 0) {
        return SguidError(SguidError::InvalidEncoding,
            "base64 input length " + std::to_string(text.size()) +
            " is not a multiple of 4");
    }

    size_t padding = 0;
    while (padding < text.size() && text[text.size() - 1 - padding] == '=') {
        ++padding;
    }
    if (padding > 2) {
        return SguidError(SguidError::InvalidEncoding,
            "base64 input has " + std::to_string(padding) + " padding characters");
    }

    std::vector<uint8_t> out;
    out.reserve(text.size() / 4 * 3);

    uint32_t acc = 0;
    int bits = 0;
    size_t data_len = text.size() - padding;
    for (size_t i = 0; i < data_len; ++i) {
        int v = decode_table[static_cast<unsigned char>(text[i])];
        if (v < 0) {
            return SguidError(SguidError::InvalidEncoding,
                std::string("invalid base64 character '") + text[i] +
                "' at position " + std::to_string(i));
        }
        acc = (acc << 6) | static_cast<uint32_t>(v);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            out.push_back(static_cast<uint8_t>((acc >> bits) & 0xFF));
        }
    }
    return Result<std::vector<uint8_t>>::ok(std::move(out));
}

} // namespace sguid::base64
