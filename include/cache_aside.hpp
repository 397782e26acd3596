// ===================== include/cache_aside.hpp =====================
#pragma once
#include "cache.hpp"
#include "diag_logger.hpp"
#include "geo_error.hpp"

#include <exception>
#include <optional>
#include <string>

namespace geoip
{
    // Specialized per cached type: static std::string encode(const T&); static T decode(const std::string&).
    // decode() throws CacheFailure on a value it cannot read.
    template <typename T>
    struct CacheCodec;

    // get / compute / set around a source query. Cache trouble never reaches the caller:
    // a failed get is a miss, a failed set still returns the fresh value.
    class CacheAside
    {
    public:
        CacheAside(Cache &cache, int ttl_seconds, DiagLogger *diag = nullptr);

        template <typename T, typename Fn>
        T cached_query(const std::string &key, Fn compute) const;

    private:
        std::optional<std::string> try_get(const std::string &key) const;
        void try_set(const std::string &key, const std::string &value) const;
        void report(const char *op, const std::string &key, const std::string &what) const;

        Cache &cache_;
        int ttl_;
        DiagLogger *diag_;
    };

    template <typename T, typename Fn>
    T CacheAside::cached_query(const std::string &key, Fn compute) const
    {
        if (auto cached = try_get(key))
        {
            try
            {
                return CacheCodec<T>::decode(*cached);
            }
            catch (const std::exception &e)
            {
                report("decode", key, e.what());
            }
        }

        T fresh = compute();
        try_set(key, CacheCodec<T>::encode(fresh));
        return fresh;
    }
} // namespace geoip
