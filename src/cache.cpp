// ===================== src/cache.cpp =====================
#include "cache.hpp"
#include "geo_error.hpp"

namespace geoip
{
    std::optional<std::string> MemoryCache::get(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = entries_.find(key);
        if (it == entries_.end())
            return std::nullopt;
        if (clk::now() >= it->second.expires)
        {
            entries_.erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    void MemoryCache::set(const std::string &key, const std::string &value, int ttl_seconds)
    {
        if (ttl_seconds <= 0)
            throw CacheFailure("invalid ttl " + std::to_string(ttl_seconds) + " for " + key);
        std::lock_guard<std::mutex> lock(mu_);
        entries_[key] = Entry{value, clk::now() + std::chrono::seconds(ttl_seconds)};
    }

    void MemoryCache::del(const std::string &key)
    {
        std::lock_guard<std::mutex> lock(mu_);
        entries_.erase(key);
    }

    size_t MemoryCache::size() const
    {
        std::lock_guard<std::mutex> lock(mu_);
        return entries_.size();
    }
} // namespace geoip
