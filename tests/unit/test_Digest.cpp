#include <catch2/catch_test_macros.hpp>

#include "infra/crypto/Digest.hpp"

using namespace camlink::infra;

TEST_CASE("Digest::md5Hex", "[Digest]") {
    REQUIRE(Digest::md5Hex("password") == "5f4dcc3b5aa765d61d8327deb882cf99");
    REQUIRE(Digest::md5Hex("") == "d41d8cd98f00b204e9800998ecf8427e");
    REQUIRE(Digest::md5Hex("admin").size() == 32);
}

TEST_CASE("Digest::sha1", "[Digest]") {
    std::vector<unsigned char> abc{'a', 'b', 'c'};

    SECTION("Raw digest") {
        auto digest = Digest::sha1(abc);
        REQUIRE(digest.size() == 20);
        REQUIRE(Digest::toHex(digest) == "a9993e364706816aba3e25717850c26c9cd0d89d");
    }

    SECTION("Base64 digest") {
        REQUIRE(Digest::sha1Base64(abc) == "qZk+NkcGgWq6PiVxeFDCbJzQ2J0=");
    }
}

TEST_CASE("Digest::httpDigestResponse", "[Digest]") {
    auto ha1 = Digest::md5Hex("admin:cam:secret");
    auto ha2 = Digest::md5Hex("DESCRIBE:rtsp://10.0.0.5/stream");
    auto expected = Digest::md5Hex(ha1 + ":abc123:" + ha2);

    REQUIRE(Digest::httpDigestResponse("admin", "cam", "secret", "DESCRIBE",
                                       "rtsp://10.0.0.5/stream", "abc123") == expected);
}

TEST_CASE("Digest::toHex", "[Digest]") {
    REQUIRE(Digest::toHex({0x00, 0x0f, 0xff}) == "000fff");
    REQUIRE(Digest::toHex({}).empty());
}
