#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace apimgr::crypto
{

    using Bytes = std::vector<uint8_t>;
    using CacheKey = std::array<uint8_t, 32>;

    /** Lower-case hex SHA-256 digest of `data`. */
    std::string sha256_hex(std::string_view data);

    std::string base64_encode(const Bytes &data);
    Result<Bytes> base64_decode(std::string_view encoded);

    /**
     * Seals cache values for storage at rest with AES-256-GCM.
     *
     * The cache key is bound as associated data, so a sealed value only opens
     * under the key it was stored for. Sealed form is base64 of
     * [12-byte nonce][ciphertext][16-byte tag].
     */
    class CacheCipher
    {
    public:
        explicit CacheCipher(const CacheKey &key);

        Result<std::string> seal(const std::string &cache_key, const std::string &plaintext) const;
        Result<std::string> open(const std::string &cache_key, const std::string &sealed) const;

        /** True when the CPU supports the AES-GCM primitive libsodium needs. */
        static bool available();

        static CacheKey generate_key();

        /**
         * Reads the key from APIMGR_CACHE_KEY (base64 of 32 bytes).
         */
        static Result<CacheKey> key_from_env();

    private:
        CacheKey key_;
    };

} // namespace apimgr::crypto
