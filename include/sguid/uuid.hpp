#pragma once

#include <sguid/result.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace sguid {

// 128-bit identifier. `bytes` holds the value in textual field order, i.e.
// bytes[0] is the first two hex digits of the canonical 36-char form.
struct Uuid {
    std::array<uint8_t, 16> bytes{};

    static Uuid v4();
    static Uuid nil();
    bool is_nil() const;

    // Canonical form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase.
    std::string to_string() const;
    static Result<Uuid> from_string(const std::string& s);

    // GUID binary layout: the first three fields (4, 2 and 2 bytes) are
    // little-endian, the trailing 8 bytes keep their textual order.
    std::array<uint8_t, 16> to_guid_bytes() const;
    static Uuid from_guid_bytes(const uint8_t* data);

    bool operator==(const Uuid& other) const;
    bool operator!=(const Uuid& other) const;
    bool operator<(const Uuid& other) const;
};

} // namespace sguid

namespace std {

template<>
struct hash<sguid::Uuid> {
    size_t operator()(const sguid::Uuid& u) const noexcept;
};

} // namespace std
