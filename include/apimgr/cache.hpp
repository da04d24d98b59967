#pragma once

#include "types.hpp"
#include <cstddef>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace apimgr
{

    /**
     * Abstract key/value store the ApiManager consults before any live call.
     * Eviction and expiry are the backend's business.
     */
    class Cache
    {
    public:
        virtual ~Cache() = default;

        /**
         * Look up a value.
         * @return the value, nullopt on a miss, or an error if the backend failed
         */
        virtual Result<std::optional<CacheValue>> get(const std::string &key) = 0;

        /** Store a value, replacing any previous value for the key. */
        virtual Result<void> put(const std::string &key, const CacheValue &value) = 0;
    };

    /**
     * In-process cache. With a non-zero `max_entries` the oldest inserted key
     * is evicted once the cap is reached.
     */
    class MemoryCache : public Cache
    {
    public:
        explicit MemoryCache(std::size_t max_entries = 0);

        Result<std::optional<CacheValue>> get(const std::string &key) override;
        Result<void> put(const std::string &key, const CacheValue &value) override;

        std::size_t size() const;
        void clear();

    private:
        std::size_t max_entries_;
        mutable std::shared_mutex mutex_;
        std::unordered_map<std::string, CacheValue> entries_;
        std::deque<std::string> insertion_order_;
    };

} // namespace apimgr
