#include <doctest/doctest.h>
#include "tablestream/base64.hpp"

#include <string>
#include <vector>

using namespace tablestream;

static std::string enc(const std::string& s) {
    return base64::encode(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

TEST_CASE("base64 encodes RFC 4648 vectors") {
    CHECK(enc("") == "");
    CHECK(enc("f") == "Zg==");
    CHECK(enc("fo") == "Zm8=");
    CHECK(enc("foo") == "Zm9v");
    CHECK(enc("foob") == "Zm9vYg==");
    CHECK(enc("fooba") == "Zm9vYmE=");
    CHECK(enc("foobar") == "Zm9vYmFy");
}

TEST_CASE("base64 encoded_size matches encode output") {
    for (size_t n = 0; n < 20; ++n) {
        std::vector<uint8_t> in(n, 0xAB);
        CHECK(base64::encode(in.data(), in.size()).size() == base64::encoded_size(n));
    }
    CHECK(base64::encoded_size(764) == 1020);
}

TEST_CASE("base64 decode appends and validates") {
    std::vector<uint8_t> out{0x01};
    REQUIRE(base64::decode("Zm9vYmE=", out));
    CHECK(out == std::vector<uint8_t>{0x01, 'f', 'o', 'o', 'b', 'a'});

    std::vector<uint8_t> junk;
    CHECK_FALSE(base64::decode("Zm9", junk));        // not a multiple of 4
    CHECK_FALSE(base64::decode("Zm=v", junk));       // pad before data
    CHECK_FALSE(base64::decode("Zg==Zm9v", junk));   // pad not in last quantum
    CHECK_FALSE(base64::decode("Zm9*", junk));       // bad character
}

TEST_CASE("base64 round-trips every byte value") {
    std::vector<uint8_t> in;
    for (int i = 0; i < 256; ++i) in.push_back(static_cast<uint8_t>(i));
    std::vector<uint8_t> out;
    REQUIRE(base64::decode(base64::encode(in.data(), in.size()), out));
    CHECK(out == in);
}
