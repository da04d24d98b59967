#pragma once

#include "cache.hpp"
#include "crypto.hpp"
#include <memory>
#include <optional>
#include <string>

namespace apimgr
{
    struct RocksDbCacheConfig
    {
        std::string path{"./data/cache"};
        bool encrypt_at_rest{false};
        std::optional<crypto::CacheKey> encryption_key; // falls back to APIMGR_CACHE_KEY
    };

    /**
     * RocksDB-backed Cache with optional AES-256-GCM encryption at rest.
     * Survives process restarts, so several runs share one response cache.
     * Throws ApiError if the database cannot be opened or no key is available
     * while encryption is requested.
     */
    class RocksDbCache : public Cache
    {
    public:
        explicit RocksDbCache(const RocksDbCacheConfig &cfg);
        ~RocksDbCache() override;

        Result<std::optional<CacheValue>> get(const std::string &key) override;
        Result<void> put(const std::string &key, const CacheValue &value) override;

    private:
        class Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace apimgr
