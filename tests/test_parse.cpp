#include <catch2/catch.hpp>
#include <sguid/short_guid.hpp>
#include <set>
#include <unordered_set>

using namespace sguid;

static const char SAMPLE_UUID[] = "c9a646d3-9c61-4cb7-bfcd-ee2522c8f633";
static const char SAMPLE_SHORT[] = "00amyWGct0y_ze4lIsj2Mw";
static const char ALIASED_SHORT[] = "bullshitmustnotbevalid";

static Uuid sample_uuid() {
    return Uuid::from_string(SAMPLE_UUID).value();
}

// ===== parse() =====

TEST_CASE("parse accepts both forms of the same identifier", "[parse]") {
    auto from_long = parse(SAMPLE_UUID, Strictness::Strict);
    auto from_short = parse(SAMPLE_SHORT, Strictness::Strict);
    REQUIRE(from_long.is_ok());
    REQUIRE(from_short.is_ok());
    REQUIRE(from_long.value() == from_short.value());
    REQUIRE(from_long.value() == sample_uuid());
}

TEST_CASE("parse accepts an uppercase canonical UUID", "[parse]") {
    auto r = parse("C9A646D3-9C61-4CB7-BFCD-EE2522C8F633", Strictness::Strict);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == sample_uuid());
}

TEST_CASE("parse treats the empty string as the nil identifier", "[parse]") {
    for (auto mode : {Strictness::Lenient, Strictness::Strict}) {
        auto r = parse("", mode);
        REQUIRE(r.is_ok());
        REQUIRE(r.value().is_nil());
    }
}

TEST_CASE("parse accepts the nil canonical UUID", "[parse]") {
    auto r = parse("00000000-0000-0000-0000-000000000000", Strictness::Strict);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().is_nil());
}

TEST_CASE("parse rejects text in neither form", "[parse]") {
    auto r = parse("Nothing to see here...", Strictness::Lenient);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SguidError::ParseFailure);
    REQUIRE(r.error().message.find("Nothing to see here...") != std::string::npos);
    REQUIRE_FALSE(r.error().hint.empty());
}

TEST_CASE("parse honors strictness for short forms", "[parse]") {
    REQUIRE(parse(ALIASED_SHORT, Strictness::Lenient).is_ok());

    auto strict = parse(ALIASED_SHORT, Strictness::Strict);
    REQUIRE(strict.is_err());
    REQUIRE(strict.error().code == SguidError::ParseFailure);
}

TEST_CASE("try_parse into Uuid", "[parse]") {
    Uuid out = Uuid::v4();
    REQUIRE(try_parse(SAMPLE_UUID, Strictness::Strict, out));
    REQUIRE(out == sample_uuid());

    REQUIRE(try_parse("", Strictness::Strict, out));
    REQUIRE(out.is_nil());

    out = Uuid::v4();
    REQUIRE_FALSE(try_parse("Nothing to see here...", Strictness::Strict, out));
    REQUIRE(out.is_nil());
}

// ===== ShortGuid wrapper =====

TEST_CASE("ShortGuid from_uuid pairs identifier and text", "[parse][wrapper]") {
    auto g = ShortGuid::from_uuid(sample_uuid());
    REQUIRE(g.value() == SAMPLE_SHORT);
    REQUIRE(g.uuid() == sample_uuid());
    REQUIRE_FALSE(g.is_empty());
}

TEST_CASE("ShortGuid decode takes the short form only", "[parse][wrapper]") {
    auto g = ShortGuid::decode(SAMPLE_SHORT, Strictness::Strict);
    REQUIRE(g.is_ok());
    REQUIRE(g.value().value() == SAMPLE_SHORT);
    REQUIRE(g.value().uuid() == sample_uuid());

    auto long_form = ShortGuid::decode(SAMPLE_UUID, Strictness::Strict);
    REQUIRE(long_form.is_err());
    REQUIRE(long_form.error().code == SguidError::InvalidEncoding);

    auto aliased = ShortGuid::decode(ALIASED_SHORT, Strictness::Strict);
    REQUIRE(aliased.is_err());
    REQUIRE(aliased.error().code == SguidError::TamperedEncoding);
}

TEST_CASE("ShortGuid never stores a non-canonical alias", "[parse][wrapper]") {
    auto g = ShortGuid::decode(ALIASED_SHORT, Strictness::Lenient);
    REQUIRE(g.is_ok());
    REQUIRE(g.value().value() == "bullshitmustnotbevaliQ");
    REQUIRE(encode(g.value().uuid()) == g.value().value());

    auto parsed = parse_short_guid(ALIASED_SHORT, Strictness::Lenient);
    REQUIRE(parsed.is_ok());
    REQUIRE(parsed.value().value() == "bullshitmustnotbevaliQ");
}

TEST_CASE("ShortGuid from_string accepts both forms", "[parse][wrapper]") {
    auto a = ShortGuid::from_string(SAMPLE_SHORT, Strictness::Strict);
    auto b = ShortGuid::from_string(SAMPLE_UUID, Strictness::Strict);
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    REQUIRE(a.value() == b.value());
    REQUIRE(b.value().value() == SAMPLE_SHORT);
}

TEST_CASE("ShortGuid from_string of empty is the empty wrapper", "[parse][wrapper]") {
    auto g = ShortGuid::from_string("", Strictness::Strict);
    REQUIRE(g.is_ok());
    REQUIRE(g.value().is_empty());
    REQUIRE(g.value() == ShortGuid::empty());
}

TEST_CASE("try_parse into ShortGuid", "[parse][wrapper]") {
    ShortGuid out = ShortGuid::new_guid();
    REQUIRE(try_parse(SAMPLE_UUID, Strictness::Strict, out));
    REQUIRE(out.value() == SAMPLE_SHORT);

    REQUIRE_FALSE(try_parse("Nothing to see here...", Strictness::Strict, out));
    REQUIRE(out == ShortGuid::empty());

    REQUIRE_FALSE(try_parse(ALIASED_SHORT, Strictness::Strict, out));
    REQUIRE(out.is_empty());
}

TEST_CASE("ShortGuid empty singleton", "[parse][wrapper]") {
    const ShortGuid& e = ShortGuid::empty();
    REQUIRE(e.is_empty());
    REQUIRE(e.value() == "AAAAAAAAAAAAAAAAAAAAAA");
    REQUIRE(e.uuid() == Uuid::nil());
    REQUIRE(&e == &ShortGuid::empty());
    REQUIRE(ShortGuid() == e);
}

TEST_CASE("ShortGuid new_guid is consistent and unique", "[parse][wrapper]") {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        auto g = ShortGuid::new_guid();
        REQUIRE(encode(g.uuid()) == g.value());
        REQUIRE(seen.insert(g.value()).second);
    }
}

// ===== Equality =====

TEST_CASE("ShortGuid equality against wrapper, Uuid and strings", "[parse][equality]") {
    auto g = ShortGuid::decode(SAMPLE_SHORT, Strictness::Strict).value();

    REQUIRE(g == g);
    REQUIRE(g.equals(sample_uuid()));
    REQUIRE(g == sample_uuid());
    REQUIRE(sample_uuid() == g);
    REQUIRE_FALSE(g != sample_uuid());
    REQUIRE_FALSE(sample_uuid() != g);

    REQUIRE(g.equals(std::string(SAMPLE_SHORT)));
    REQUIRE(g.equals(std::string(SAMPLE_UUID)));
    REQUIRE(g.equals(std::string("C9A646D3-9C61-4CB7-BFCD-EE2522C8F633")));
}

TEST_CASE("ShortGuid inequality", "[parse][equality]") {
    auto g = ShortGuid::from_uuid(sample_uuid());
    auto other = ShortGuid::new_guid();

    REQUIRE(g != other);
    REQUIRE(g != other.uuid());
    REQUIRE(other.uuid() != g);
    REQUIRE_FALSE(g.equals(other.value()));
    REQUIRE_FALSE(g.equals(std::string("Nothing to see here...")));
    REQUIRE_FALSE(g.equals(std::string()));
    REQUIRE_FALSE(ShortGuid::empty().equals(std::string()));
}

TEST_CASE("ShortGuid string equality rejects aliases", "[parse][equality]") {
    auto g = ShortGuid::decode("bullshitmustnotbevaliQ", Strictness::Strict).value();
    REQUIRE(g.equals(std::string("bullshitmustnotbevaliQ")));
    REQUIRE_FALSE(g.equals(std::string(ALIASED_SHORT)));
}

TEST_CASE("ShortGuid equality ignores which text produced it", "[parse][equality]") {
    auto a = ShortGuid::from_string(SAMPLE_UUID, Strictness::Strict).value();
    auto b = ShortGuid::from_string(SAMPLE_SHORT, Strictness::Strict).value();
    auto c = ShortGuid::from_string("00amyWGct0y/ze4lIsj2Mw", Strictness::Lenient).value();
    REQUIRE(a == b);
    REQUIRE(b == c);
    REQUIRE(std::hash<ShortGuid>()(a) == std::hash<ShortGuid>()(c));
}

TEST_CASE("ShortGuid ordering and hashing follow the identifier", "[parse][equality]") {
    Uuid lo = Uuid::nil();
    Uuid hi = Uuid::nil();
    hi.bytes[0] = 1;

    auto a = ShortGuid::from_uuid(lo);
    auto b = ShortGuid::from_uuid(hi);
    REQUIRE(a < b);
    REQUIRE_FALSE(b < a);

    std::unordered_set<ShortGuid> set;
    set.insert(a);
    set.insert(ShortGuid::empty());
    set.insert(b);
    REQUIRE(set.size() == 2);
}
