// ===================== src/cache_aside.cpp =====================
#include "cache_aside.hpp"

#include <exception>
#include <stdexcept>

namespace geoip
{
    CacheAside::CacheAside(Cache &cache, int ttl_seconds, DiagLogger *diag)
        : cache_(cache), ttl_(ttl_seconds), diag_(diag)
    {
        if (ttl_seconds <= 0)
            throw std::invalid_argument("cache ttl must be a positive number of seconds");
    }

    // Anything a backend throws counts as a cache failure.
    std::optional<std::string> CacheAside::try_get(const std::string &key) const
    {
        try
        {
            return cache_.get(key);
        }
        catch (const std::exception &e)
        {
            report("get", key, e.what());
            return std::nullopt;
        }
    }

    void CacheAside::try_set(const std::string &key, const std::string &value) const
    {
        try
        {
            cache_.set(key, value, ttl_);
        }
        catch (const std::exception &e)
        {
            report("set", key, e.what());
        }
    }

    void CacheAside::report(const char *op, const std::string &key, const std::string &what) const
    {
        if (diag_)
            diag_->notice_error("cache", std::string("failed to ") + op + " cached geoip info key=" + key + ": " + what);
    }
} // namespace geoip
