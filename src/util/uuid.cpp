#include <sguid/uuid.hpp>
#include <fstream>
#include <random>

namespace sguid {

// ---- RNG: /dev/urandom with mt19937_64 fallback ----

static void fill_random_bytes(uint8_t* buf, size_t len) {
    std::ifstream urandom("/dev/urandom", std::ios::binary);
    if (urandom.is_open()) {
        urandom.read(reinterpret_cast<char*>(buf), static_cast<std::streamsize>(len));
        if (static_cast<size_t>(urandom.gcount()) == len) return;
    }
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<unsigned> dist(0, 255);
    for (size_t i = 0; i < len; ++i) {
        buf[i] = static_cast<uint8_t>(dist(gen));
    }
}

static const char hex_chars[] = "0123456789abcdef";

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

Uuid Uuid::v4() {
    Uuid u;
    fill_random_bytes(u.bytes.data(), 16);
    // version 4 in the high nibble of byte 6, variant 10xx in byte 8
    u.bytes[6] = (u.bytes[6] & 0x0F) | 0x40;
    u.bytes[8] = (u.bytes[8] & 0x3F) | 0x80;
    return u;
}

Uuid Uuid::nil() {
    return Uuid{};
}

bool Uuid::is_nil() const {
    for (uint8_t b : bytes) {
        if (b != 0) return false;
    }
    return true;
}

std::string Uuid::to_string() const {
    std::string out;
    out.reserve(36);
    for (int i = 0; i < 16; ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

Result<Uuid> Uuid::from_string(const std::string& s) {
    if (s.size() != 36) {
        return SguidError(SguidError::Parse,
            "UUID string must be 36 characters, got " + std::to_string(s.size()),
            "expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx");
    }
    if (s[8] != '-' || s[13] != '-' || s[18] != '-' || s[23] != '-') {
        return SguidError(SguidError::Parse,
            "UUID string has invalid dash positions: '" + s + "'",
            "expected dashes at positions 8, 13, 18, 23");
    }

    Uuid u;
    int byte_idx = 0;
    for (int i = 0; i < 36; ) {
        if (s[i] == '-') { ++i; continue; }
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            return SguidError(SguidError::Parse,
                "UUID string contains invalid hex character: '" + s + "'",
                "invalid char at position " + std::to_string(hi < 0 ? i : i + 1));
        }
        u.bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<Uuid>::ok(u);
}

// Byte permutation between textual order and GUID layout. It is its own
// inverse, so both directions share it.
static constexpr int guid_order[16] = {
    3, 2, 1, 0,
    5, 4,
    7, 6,
    8, 9, 10, 11, 12, 13, 14, 15
};

std::array<uint8_t, 16> Uuid::to_guid_bytes() const {
    std::array<uint8_t, 16> out;
    for (int i = 0; i < 16; ++i) {
        out[i] = bytes[guid_order[i]];
    }
    return out;
}

Uuid Uuid::from_guid_bytes(const uint8_t* data) {
    Uuid u;
    for (int i = 0; i < 16; ++i) {
        u.bytes[guid_order[i]] = data[i];
    }
    return u;
}

bool Uuid::operator==(const Uuid& other) const {
    return bytes == other.bytes;
}

bool Uuid::operator!=(const Uuid& other) const {
    return bytes != other.bytes;
}

bool Uuid::operator<(const Uuid& other) const {
    return bytes < other.bytes;
}

} // namespace sguid

namespace std {

size_t hash<sguid::Uuid>::operator()(const sguid::Uuid& u) const noexcept {
    // FNV-1a over the 16 bytes
    uint64_t h = 1469598103934665603ULL;
    for (uint8_t b : u.bytes) {
        h ^= b;
        h *= 1099511628211ULL;
    }
    return static_cast<size_t>(h);
}

} // namespace std
