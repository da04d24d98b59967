#include "apimgr/rocksdb_cache.hpp"
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <spdlog/spdlog.h>

namespace apimgr
{
    namespace
    {
        crypto::CacheKey resolve_key(const RocksDbCacheConfig &cfg)
        {
            if (cfg.encryption_key)
                return *cfg.encryption_key;
            auto key = crypto::CacheCipher::key_from_env();
            if (!key)
                throw ApiError::config(std::string("Missing cache encryption key: ") + key.error().what());
            return *key;
        }
    } // namespace

    class RocksDbCache::Impl
    {
    public:
        explicit Impl(const RocksDbCacheConfig &cfg)
        {
            if (cfg.encrypt_at_rest)
                cipher.emplace(resolve_key(cfg));

            rocksdb::Options options;
            options.create_if_missing = true;
            rocksdb::DB *raw = nullptr;
            auto status = rocksdb::DB::Open(options, cfg.path, &raw);
            if (!status.ok())
            {
                throw ApiError::storage("RocksDB open failed: " + status.ToString());
            }
            db.reset(raw);
            spdlog::debug("rocksdb cache opened at {} (encrypted: {})", cfg.path, cipher.has_value());
        }

        Result<std::optional<CacheValue>> get(const std::string &key)
        {
            std::string stored;
            auto status = db->Get(rocksdb::ReadOptions(), key, &stored);
            if (status.IsNotFound())
                return std::optional<CacheValue>();
            if (!status.ok())
                return std::unexpected(ApiError::cache("RocksDB Get failed: " + status.ToString()));

            if (!cipher)
                return std::optional<CacheValue>(std::move(stored));

            auto plain = cipher->open(key, stored);
            if (!plain)
                return std::unexpected(ApiError::cache(std::string("Unreadable cache entry: ") + plain.error().what()));
            return std::optional<CacheValue>(std::move(*plain));
        }

        Result<void> put(const std::string &key, const CacheValue &value)
        {
            std::string stored = value;
            if (cipher)
            {
                auto sealed = cipher->seal(key, value);
                if (!sealed)
                    return std::unexpected(ApiError::cache(std::string("Cache entry encryption failed: ") + sealed.error().what()));
                stored = std::move(*sealed);
            }

            auto status = db->Put(rocksdb::WriteOptions(), key, stored);
            if (!status.ok())
            {
                return std::unexpected(ApiError::cache("RocksDB Put failed: " + status.ToString()));
            }
            return {};
        }

    private:
        std::unique_ptr<rocksdb::DB> db;
        std::optional<crypto::CacheCipher> cipher;
    };

    RocksDbCache::RocksDbCache(const RocksDbCacheConfig &cfg) : impl_(std::make_unique<Impl>(cfg)) {}
    RocksDbCache::~RocksDbCache() = default;

    Result<std::optional<CacheValue>> RocksDbCache::get(const std::string &key)
    {
        return impl_->get(key);
    }

    Result<void> RocksDbCache::put(const std::string &key, const CacheValue &value)
    {
        return impl_->put(key, value);
    }

} // namespace apimgr
