// ===================== include/cache.hpp =====================
#pragma once
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace geoip
{
    // Backend contract. Any operation may throw CacheFailure.
    class Cache
    {
    public:
        virtual ~Cache() = default;

        virtual std::optional<std::string> get(const std::string &key) = 0;
        virtual void set(const std::string &key, const std::string &value, int ttl_seconds) = 0;
        virtual void del(const std::string &key) = 0;
    };

    // Always misses, drops writes.
    class NullCache : public Cache
    {
    public:
        std::optional<std::string> get(const std::string &) override { return std::nullopt; }
        void set(const std::string &, const std::string &, int) override {}
        void del(const std::string &) override {}
    };

    // In-process store with per-entry expiry. Expired entries are dropped lazily on get().
    class MemoryCache : public Cache
    {
    public:
        using clk = std::chrono::steady_clock;

        std::optional<std::string> get(const std::string &key) override;
        void set(const std::string &key, const std::string &value, int ttl_seconds) override;
        void del(const std::string &key) override;

        size_t size() const;

    private:
        struct Entry
        {
            std::string value;
            clk::time_point expires;
        };

        mutable std::mutex mu_;
        std::unordered_map<std::string, Entry> entries_;
    };
} // namespace geoip
