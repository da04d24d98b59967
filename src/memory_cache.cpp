#include "apimgr/cache.hpp"
#include <mutex>

namespace apimgr
{
    MemoryCache::MemoryCache(std::size_t max_entries) : max_entries_(max_entries) {}

    Result<std::optional<CacheValue>> MemoryCache::get(const std::string &key)
    {
        std::shared_lock lock(mutex_);
        if (auto it = entries_.find(key); it != entries_.end())
            return std::optional<CacheValue>(it->second);
        return std::optional<CacheValue>();
    }

    Result<void> MemoryCache::put(const std::string &key, const CacheValue &value)
    {
        std::unique_lock lock(mutex_);
        if (auto it = entries_.find(key); it != entries_.end())
        {
            it->second = value;
            return {};
        }

        if (max_entries_ > 0)
        {
            while (entries_.size() >= max_entries_ && !insertion_order_.empty())
            {
                entries_.erase(insertion_order_.front());
                insertion_order_.pop_front();
            }
        }
        entries_.emplace(key, value);
        insertion_order_.push_back(key);
        return {};
    }

    std::size_t MemoryCache::size() const
    {
        std::shared_lock lock(mutex_);
        return entries_.size();
    }

    void MemoryCache::clear()
    {
        std::unique_lock lock(mutex_);
        entries_.clear();
        insertion_order_.clear();
    }

} // namespace apimgr
