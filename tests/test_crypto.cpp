#include <catch2/catch_test_macros.hpp>
#include "apimgr/crypto.hpp"
#include <cstdlib>
#include <string>

using namespace apimgr::crypto;

TEST_CASE("sha256_hex matches known digests", "[crypto]")
{
    REQUIRE(sha256_hex("") == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    REQUIRE(sha256_hex("abc") == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("Base64 round trip", "[crypto]")
{
    Bytes data = {0x00, 0x01, 0x02, 0x03, 0xFF, 0xFE};
    auto encoded = base64_encode(data);
    REQUIRE(encoded == "AAECA//+");

    auto decoded = base64_decode(encoded);
    REQUIRE(decoded.has_value());
    REQUIRE(*decoded == data);

    REQUIRE(base64_encode({}).empty());
    REQUIRE_FALSE(base64_decode("***").has_value());
}

TEST_CASE("CacheCipher seals values to their cache key", "[crypto]")
{
    if (!CacheCipher::available())
        SKIP("AES-GCM not supported on this CPU");

    CacheCipher cipher(CacheCipher::generate_key());
    std::string value = R"({"status":200,"body":"ok"})";

    auto sealed = cipher.seal("k1", value);
    REQUIRE(sealed.has_value());
    REQUIRE(sealed->find("ok") == std::string::npos);

    auto opened = cipher.open("k1", *sealed);
    REQUIRE(opened.has_value());
    REQUIRE(*opened == value);

    SECTION("a value moved to another key does not open")
    {
        auto moved = cipher.open("k2", *sealed);
        REQUIRE_FALSE(moved.has_value());
        REQUIRE(moved.error().code == apimgr::ErrorCode::CryptoError);
    }

    SECTION("another cache key cannot open it")
    {
        CacheCipher other(CacheCipher::generate_key());
        REQUIRE_FALSE(other.open("k1", *sealed).has_value());
    }

    SECTION("each seal uses a fresh nonce")
    {
        REQUIRE(*cipher.seal("k1", value) != *sealed);
    }

    SECTION("truncated input is rejected")
    {
        REQUIRE_FALSE(cipher.open("k1", "AAAA").has_value());
    }
}

TEST_CASE("Cache key comes from APIMGR_CACHE_KEY", "[crypto]")
{
    auto raw = CacheCipher::generate_key();
    ::setenv("APIMGR_CACHE_KEY", base64_encode(Bytes(raw.begin(), raw.end())).c_str(), 1);

    auto key = CacheCipher::key_from_env();
    REQUIRE(key.has_value());
    REQUIRE(*key == raw);

    ::setenv("APIMGR_CACHE_KEY", base64_encode(Bytes(16, 0x11)).c_str(), 1);
    REQUIRE_FALSE(CacheCipher::key_from_env().has_value());

    ::setenv("APIMGR_CACHE_KEY", "not base64!", 1);
    REQUIRE_FALSE(CacheCipher::key_from_env().has_value());

    ::unsetenv("APIMGR_CACHE_KEY");
    auto missing = CacheCipher::key_from_env();
    REQUIRE_FALSE(missing.has_value());
    REQUIRE(missing.error().code == apimgr::ErrorCode::ConfigError);
}
