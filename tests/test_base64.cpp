#include <catch2/catch.hpp>
#include <sguid/base64.hpp>
#include <string>

using namespace sguid;

static std::string enc(const std::string& s) {
    return base64::encode(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

static std::string dec(const std::string& s) {
    auto r = base64::decode(s);
    REQUIRE(r.is_ok());
    return std::string(r.value().begin(), r.value().end());
}

TEST_CASE("base64 encode RFC 4648 vectors", "[base64]") {
    REQUIRE(enc("") == "");
    REQUIRE(enc("f") == "Zg==");
    REQUIRE(enc("fo") == "Zm8=");
    REQUIRE(enc("foo") == "Zm9v");
    REQUIRE(enc("foob") == "Zm9vYg==");
    REQUIRE(enc("fooba") == "Zm9vYmE=");
    REQUIRE(enc("foobar") == "Zm9vYmFy");
}

TEST_CASE("base64 decode RFC 4648 vectors", "[base64]") {
    REQUIRE(dec("") == "");
    REQUIRE(dec("Zg==") == "f");
    REQUIRE(dec("Zm8=") == "fo");
    REQUIRE(dec("Zm9v") == "foo");
    REQUIRE(dec("Zm9vYmFy") == "foobar");
}

TEST_CASE("base64 uses the standard alphabet", "[base64]") {
    const uint8_t bytes[] = {0xfb, 0xff, 0xbf};
    REQUIRE(base64::encode(bytes, 3) == "+/+/");
    auto r = base64::decode("+/+/");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == std::vector<uint8_t>{0xfb, 0xff, 0xbf});

    auto url = base64::decode("-_-_");
    REQUIRE(url.is_err());
    REQUIRE(url.error().code == SguidError::InvalidEncoding);
}

TEST_CASE("base64 decode ignores unused trailing bits", "[base64]") {
    // "Zh==" differs from "Zg==" only in bits that carry no data
    REQUIRE(dec("Zh==") == "f");
    REQUIRE(dec("Zm9=") == "fo");
}

TEST_CASE("base64 decode rejects bad length", "[base64]") {
    auto r = base64::decode("Zm9vY");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == SguidError::InvalidEncoding);
}

TEST_CASE("base64 decode rejects misplaced padding", "[base64]") {
    REQUIRE(base64::decode("Z===").is_err());
    REQUIRE(base64::decode("Zg==Zm8=").is_err());
    REQUIRE(base64::decode("Z=g=").is_err());
}

TEST_CASE("base64 decode rejects whitespace and symbols", "[base64]") {
    auto r = base64::decode("Zm9 v");
    REQUIRE(r.is_err());
    REQUIRE(base64::decode("Zm9v\n").is_err());
    REQUIRE(base64::decode("Zm9?").is_err());
}
