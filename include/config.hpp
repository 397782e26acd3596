// ===================== include/config.hpp =====================
#pragma once
#include "diag_logger.hpp"

#include <string>
#include <vector>

namespace geoip
{
    struct Config
    {
        int cache_ttl_seconds = 3600;
        int source_timeout_ms = 5000;
        std::string allowlist_path = "config/allowlist-ips.txt";
        std::string log_path; // empty = stderr
        LogLevel log_level = LogLevel::Info;

        std::string ip2location_key;
        std::string ipinfo_token;
        std::string maxmind_account;
        std::string maxmind_license;

        std::string ip2location_url = "https://api.ip2location.io";
        std::string ipmap_url = "https://ipmap-api.ripe.net";
        std::string maxmind_url = "https://geoip.maxmind.com";
        std::string ipinfo_url = "https://ipinfo.io";
        std::string fastly_url = "https://globalping-geoip.global.ssl.fastly.net";

        // Overrides defaults from GEOIP_* and provider credential environment variables.
        // Throws std::invalid_argument on malformed values.
        void apply_env();

        // Consumes "--key=value" flags it knows and returns the remaining arguments.
        // Throws std::invalid_argument on unknown flags or malformed values.
        std::vector<std::string> apply_args(const std::vector<std::string> &args);
    };
} // namespace geoip
