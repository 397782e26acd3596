// ===================== src/config.cpp =====================
#include "config.hpp"

#include <cstdlib>
#include <stdexcept>

namespace geoip
{
    namespace
    {
        int parse_positive(const std::string &name, const std::string &value)
        {
            if (value.empty() || value.size() > 9 || value.find_first_not_of("0123456789") != std::string::npos)
                throw std::invalid_argument("bad value for " + name + ": " + value);
            int n = std::stoi(value);
            if (n <= 0)
                throw std::invalid_argument(name + " must be positive");
            return n;
        }

        LogLevel parse_level(const std::string &name, const std::string &value)
        {
            auto lvl = parse_log_level(value);
            if (!lvl)
                throw std::invalid_argument("bad value for " + name + ": " + value + " (debug|info|warn|error)");
            return *lvl;
        }

        bool env(const char *name, std::string &out)
        {
            const char *v = std::getenv(name);
            if (!v || !*v)
                return false;
            out = v;
            return true;
        }
    } // namespace

    void Config::apply_env()
    {
        std::string v;
        if (env("GEOIP_CACHE_TTL", v))
            cache_ttl_seconds = parse_positive("GEOIP_CACHE_TTL", v);
        if (env("GEOIP_SOURCE_TIMEOUT_MS", v))
            source_timeout_ms = parse_positive("GEOIP_SOURCE_TIMEOUT_MS", v);
        if (env("GEOIP_LOG_LEVEL", v))
            log_level = parse_level("GEOIP_LOG_LEVEL", v);
        env("GEOIP_ALLOWLIST", allowlist_path);
        env("GEOIP_LOG", log_path);
        env("IP2LOCATION_API_KEY", ip2location_key);
        env("IPINFO_TOKEN", ipinfo_token);
        env("MAXMIND_ACCOUNT_ID", maxmind_account);
        env("MAXMIND_LICENSE_KEY", maxmind_license);
    }

    std::vector<std::string> Config::apply_args(const std::vector<std::string> &args)
    {
        std::vector<std::string> pos;
        for (const auto &a : args)
        {
            if (a.rfind("--", 0) != 0)
            {
                pos.push_back(a);
                continue;
            }
            size_t eq = a.find('=');
            if (eq == std::string::npos)
                throw std::invalid_argument("flag needs a value: " + a);
            const std::string key = a.substr(2, eq - 2);
            const std::string value = a.substr(eq + 1);

            if (key == "ttl")
                cache_ttl_seconds = parse_positive("--ttl", value);
            else if (key == "timeout-ms")
                source_timeout_ms = parse_positive("--timeout-ms", value);
            else if (key == "allowlist")
                allowlist_path = value;
            else if (key == "log")
                log_path = value;
            else if (key == "log-level")
                log_level = parse_level("--log-level", value);
            else
                throw std::invalid_argument("unknown flag: --" + key);
        }
        return pos;
    }
} // namespace geoip
