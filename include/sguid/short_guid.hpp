#pragma once

#include <sguid/result.hpp>
#include <sguid/uuid.hpp>
#include <cstddef>
#include <functional>
#include <string>

namespace sguid {

// Number of characters in an encoded identifier.
constexpr size_t SHORT_GUID_LENGTH = 22;

// Whether decoding must also prove the input is the canonical encoding.
// Every decode/parse entry point takes this explicitly.
enum class Strictness {
    Lenient,  // accept any string that decodes to 16 bytes
    Strict    // additionally require encode(result) == input
};

// ---- Encoder ----

// 22 URL-safe characters: base64 of the GUID binary layout with '/' -> '_',
// '+' -> '-' and the "==" padding dropped.
std::string encode(const Uuid& id);

// ---- Decoder ----

// InvalidEncoding when `text` is not base64 (after undoing the substitution)
// of exactly 16 bytes. In Strict mode also TamperedEncoding when `text` is
// decodable but differs from the canonical encoding of its identifier; the
// lenient mode keeps accepting such aliases, which differ only in the four
// unused bits of the last character.
Result<Uuid> decode(const std::string& text, Strictness strictness);

// Boolean form of decode(). `out` is the nil UUID on failure.
bool try_decode(const std::string& text, Strictness strictness, Uuid& out);

// ---- Dual-format parser ----

// Accepts a short guid first, then the canonical 36-char UUID form.
// The empty string parses to the nil UUID; note this makes "" a valid
// identifier for every caller of parse(). Anything else fails with
// ParseFailure.
Result<Uuid> parse(const std::string& text, Strictness strictness);

// Boolean form of parse(). `out` is the nil UUID on failure.
bool try_parse(const std::string& text, Strictness strictness, Uuid& out);

// ---- Wrapper ----

// An identifier together with its encoded form. encode(uuid()) == value()
// holds for every instance. Equality, ordering and hashing use the
// identifier only.
class ShortGuid {
public:
    // The empty wrapper (nil UUID).
    ShortGuid();

    static ShortGuid from_uuid(const Uuid& id);

    // Short form only; a canonical UUID string is rejected.
    static Result<ShortGuid> decode(const std::string& text, Strictness strictness);

    // Short form or canonical form, see parse().
    static Result<ShortGuid> from_string(const std::string& text, Strictness strictness);

    static ShortGuid new_guid();
    static const ShortGuid& empty();

    const std::string& value() const { return encoded_; }
    const Uuid& uuid() const { return uuid_; }
    bool is_empty() const { return uuid_.is_nil(); }

    bool equals(const Uuid& id) const;
    // True if `text` is this identifier in strict short form or in
    // canonical form. Unparseable text, including "", is never equal.
    bool equals(const std::string& text) const;

    bool operator==(const ShortGuid& other) const;
    bool operator!=(const ShortGuid& other) const;
    bool operator<(const ShortGuid& other) const;

private:
    ShortGuid(const Uuid& id, std::string encoded);

    Uuid uuid_;
    std::string encoded_;
};

bool operator==(const ShortGuid& lhs, const Uuid& rhs);
bool operator==(const Uuid& lhs, const ShortGuid& rhs);
bool operator!=(const ShortGuid& lhs, const Uuid& rhs);
bool operator!=(const Uuid& lhs, const ShortGuid& rhs);

// parse() returning the wrapper.
Result<ShortGuid> parse_short_guid(const std::string& text, Strictness strictness);

// Boolean form of parse_short_guid(). `out` is ShortGuid::empty() on failure.
bool try_parse(const std::string& text, Strictness strictness, ShortGuid& out);

const char* strictness_name(Strictness strictness);

} // namespace sguid

namespace std {

template<>
struct hash<sguid::ShortGuid> {
    size_t operator()(const sguid::ShortGuid& g) const noexcept {
        return hash<sguid::Uuid>()(g.uuid());
    }
};

} // namespace std
