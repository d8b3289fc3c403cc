#include <sguid/short_guid.hpp>
#include <sguid/base64.hpp>

namespace sguid {

static const char PARSE_HINT[] =
    "expected a 22-character short guid or a UUID "
    "(xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx)";

// ---- Encoder ----

std::string encode(const Uuid& id) {
    auto raw = id.to_guid_bytes();
    std::string out = base64::encode(raw.data(), raw.size());
    out.resize(SHORT_GUID_LENGTH);  // drops "=="
    for (char& c : out) {
        if (c == '/') c = '_';
        else if (c == '+') c = '-';
    }
    return out;
}

// ---- Decoder ----

Result<Uuid> decode(const std::string& text, Strictness strictness) {
    std::string b64 = text;
    for (char& c : b64) {
        if (c == '_') c = '/';
        else if (c == '-') c = '+';
    }
    b64 += "==";

    auto raw = base64::decode(b64);
    if (raw.is_err()) {
        return SguidError(SguidError::InvalidEncoding,
            "'" + text + "' is not a valid short guid: " + raw.error().message);
    }
    if (raw.value().size() != 16) {
        return SguidError(SguidError::InvalidEncoding,
            "'" + text + "' decodes to " + std::to_string(raw.value().size()) +
            " bytes, expected 16");
    }

    Uuid id = Uuid::from_guid_bytes(raw.value().data());

    if (strictness == Strictness::Strict) {
        std::string canonical = encode(id);
        if (canonical != text) {
            return SguidError(SguidError::TamperedEncoding,
                "short guid '" + text + "' is not the canonical encoding of " +
                id.to_string() + "; expected '" + canonical + "'",
                "the value may have been altered; only the canonical form is accepted");
        }
    }
    return Result<Uuid>::ok(id);
}

bool try_decode(const std::string& text, Strictness strictness, Uuid& out) {
    auto r = decode(text, strictness);
    out = r.value_or(Uuid::nil());
    return r.is_ok();
}

// ---- Dual-format parser ----

static SguidError parse_failure(const std::string& text) {
    return SguidError(SguidError::ParseFailure,
        "'" + text + "' is neither a short guid nor a UUID", PARSE_HINT);
}

Result<Uuid> parse(const std::string& text, Strictness strictness) {
    if (text.empty()) {
        return Result<Uuid>::ok(Uuid::nil());
    }
    return decode(text, strictness).or_else([&](const SguidError&) -> Result<Uuid> {
        auto canonical = Uuid::from_string(text);
        if (canonical.is_ok()) return canonical;
        return parse_failure(text);
    });
}

bool try_parse(const std::string& text, Strictness strictness, Uuid& out) {
    auto r = parse(text, strictness);
    out = r.value_or(Uuid::nil());
    return r.is_ok();
}

// ---- Wrapper ----

ShortGuid::ShortGuid() : ShortGuid(Uuid::nil(), encode(Uuid::nil())) {}

ShortGuid::ShortGuid(const Uuid& id, std::string encoded)
    : uuid_(id), encoded_(std::move(encoded)) {}

ShortGuid ShortGuid::from_uuid(const Uuid& id) {
    return ShortGuid(id, encode(id));
}

Result<ShortGuid> ShortGuid::decode(const std::string& text, Strictness strictness) {
    auto id = sguid::decode(text, strictness);
    if (id.is_err()) return std::move(id).error();
    // A leniently accepted alias is not stored; the wrapper keeps the
    // canonical text.
    if (strictness == Strictness::Strict) {
        return Result<ShortGuid>::ok(ShortGuid(id.value(), text));
    }
    return Result<ShortGuid>::ok(from_uuid(id.value()));
}

Result<ShortGuid> ShortGuid::from_string(const std::string& text, Strictness strictness) {
    return parse_short_guid(text, strictness);
}

ShortGuid ShortGuid::new_guid() {
    return from_uuid(Uuid::v4());
}

const ShortGuid& ShortGuid::empty() {
    static const ShortGuid instance;
    return instance;
}

bool ShortGuid::equals(const Uuid& id) const {
    return uuid_ == id;
}

bool ShortGuid::equals(const std::string& text) const {
    Uuid other;
    if (try_decode(text, Strictness::Strict, other)) {
        return uuid_ == other;
    }
    auto canonical = Uuid::from_string(text);
    return canonical.is_ok() && uuid_ == canonical.value();
}

bool ShortGuid::operator==(const ShortGuid& other) const {
    return uuid_ == other.uuid_;
}

bool ShortGuid::operator!=(const ShortGuid& other) const {
    return uuid_ != other.uuid_;
}

bool ShortGuid::operator<(const ShortGuid& other) const {
    return uuid_ < other.uuid_;
}

bool operator==(const ShortGuid& lhs, const Uuid& rhs) { return lhs.equals(rhs); }
bool operator==(const Uuid& lhs, const ShortGuid& rhs) { return rhs.equals(lhs); }
bool operator!=(const ShortGuid& lhs, const Uuid& rhs) { return !lhs.equals(rhs); }
bool operator!=(const Uuid& lhs, const ShortGuid& rhs) { return !rhs.equals(lhs); }

Result<ShortGuid> parse_short_guid(const std::string& text, Strictness strictness) {
    if (text.empty()) {
        return Result<ShortGuid>::ok(ShortGuid::empty());
    }
    auto short_form = ShortGuid::decode(text, strictness);
    if (short_form.is_ok()) return short_form;

    auto canonical = Uuid::from_string(text);
    if (canonical.is_ok()) {
        return Result<ShortGuid>::ok(ShortGuid::from_uuid(canonical.value()));
    }
    return parse_failure(text);
}

bool try_parse(const std::string& text, Strictness strictness, ShortGuid& out) {
    auto r = parse_short_guid(text, strictness);
    out = r.is_ok() ? r.value() : ShortGuid::empty();
    return r.is_ok();
}

const char* strictness_name(Strictness strictness) {
    switch (strictness) {
        case Strictness::Lenient: return "lenient";
        case Strictness::Strict:  return "strict";
    }
    return "unknown";
}

} // namespace sguid
