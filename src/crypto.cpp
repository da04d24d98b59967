#include "apimgr/crypto.hpp"
#include <sodium.h>
#include <algorithm>
#include <cstdlib>

namespace apimgr::crypto
{
    namespace
    {
        struct SodiumInitializer
        {
            SodiumInitializer()
            {
                if (sodium_init() < 0)
                {
                    throw std::runtime_error("Failed to initialize libsodium");
                }
            }
        } sodium_initializer;

        constexpr std::size_t kNonceSize = crypto_aead_aes256gcm_NPUBBYTES;
        constexpr std::size_t kTagSize = crypto_aead_aes256gcm_ABYTES;

        const unsigned char *bytes_of(std::string_view s)
        {
            return reinterpret_cast<const unsigned char *>(s.data());
        }
    } // namespace

    std::string sha256_hex(std::string_view data)
    {
        std::array<unsigned char, crypto_hash_sha256_BYTES> digest;
        crypto_hash_sha256(digest.data(), bytes_of(data), data.size());

        // sodium_bin2hex writes a trailing NUL
        std::string hex(digest.size() * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), digest.data(), digest.size());
        hex.resize(digest.size() * 2);
        return hex;
    }

    std::string base64_encode(const Bytes &data)
    {
        std::string encoded(sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL), '\0');
        sodium_bin2base64(encoded.data(), encoded.size(), data.data(), data.size(), sodium_base64_VARIANT_ORIGINAL);
        encoded.resize(encoded.size() - 1);
        return encoded;
    }

    Result<Bytes> base64_decode(std::string_view encoded)
    {
        Bytes decoded(encoded.size() / 4 * 3 + 3);
        std::size_t decoded_len = 0;
        if (sodium_base642bin(decoded.data(), decoded.size(), encoded.data(), encoded.size(),
                              nullptr, &decoded_len, nullptr, sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(ApiError::crypto("Invalid base64 encoding"));
        }
        decoded.resize(decoded_len);
        return decoded;
    }

    CacheCipher::CacheCipher(const CacheKey &key) : key_(key) {}

    bool CacheCipher::available()
    {
        return crypto_aead_aes256gcm_is_available() == 1;
    }

    CacheKey CacheCipher::generate_key()
    {
        CacheKey key;
        crypto_aead_aes256gcm_keygen(key.data());
        return key;
    }

    Result<std::string> CacheCipher::seal(const std::string &cache_key, const std::string &plaintext) const
    {
        if (!available())
            return std::unexpected(ApiError::crypto("AES-256-GCM not supported on this CPU"));

        Bytes sealed(kNonceSize + plaintext.size() + kTagSize);
        randombytes_buf(sealed.data(), kNonceSize);

        unsigned long long cipher_len = 0;
        if (crypto_aead_aes256gcm_encrypt(sealed.data() + kNonceSize, &cipher_len,
                                          bytes_of(plaintext), plaintext.size(),
                                          bytes_of(cache_key), cache_key.size(),
                                          nullptr, sealed.data(), key_.data()) != 0)
        {
            return std::unexpected(ApiError::crypto("AES-256-GCM encryption failed"));
        }
        sealed.resize(kNonceSize + cipher_len);
        return base64_encode(sealed);
    }

    Result<std::string> CacheCipher::open(const std::string &cache_key, const std::string &sealed) const
    {
        if (!available())
            return std::unexpected(ApiError::crypto("AES-256-GCM not supported on this CPU"));

        auto raw = base64_decode(sealed);
        if (!raw)
            return std::unexpected(raw.error());
        if (raw->size() < kNonceSize + kTagSize)
            return std::unexpected(ApiError::crypto("Sealed value too short"));

        std::string plaintext(raw->size() - kNonceSize - kTagSize, '\0');
        unsigned long long plain_len = 0;
        if (crypto_aead_aes256gcm_decrypt(reinterpret_cast<unsigned char *>(plaintext.data()), &plain_len, nullptr,
                                          raw->data() + kNonceSize, raw->size() - kNonceSize,
                                          bytes_of(cache_key), cache_key.size(),
                                          raw->data(), key_.data()) != 0)
        {
            return std::unexpected(ApiError::crypto("AES-256-GCM authentication failed"));
        }
        plaintext.resize(plain_len);
        return plaintext;
    }

    Result<CacheKey> CacheCipher::key_from_env()
    {
        const char *env_key = std::getenv("APIMGR_CACHE_KEY");
        if (env_key == nullptr)
            return std::unexpected(ApiError::config("APIMGR_CACHE_KEY is not set"));

        auto decoded = base64_decode(env_key);
        if (!decoded)
            return std::unexpected(ApiError::config(std::string("APIMGR_CACHE_KEY: ") + decoded.error().what()));
        if (decoded->size() != CacheKey{}.size())
            return std::unexpected(ApiError::config("APIMGR_CACHE_KEY must be 32 bytes when base64-decoded"));

        CacheKey key;
        std::copy(decoded->begin(), decoded->end(), key.begin());
        return key;
    }

} // namespace apimgr::crypto
