// ===================== include/parsed_url.hpp =====================
#pragma once
#include <string>
#include <utility>
#include <vector>

namespace geoip
{
    class ParsedURL
    {
    public:
        std::string scheme; // "http" or "https"
        std::string host;   // e.g., "api.ip2location.io"
        int port;           // explicit ":port" or the scheme default
        std::string path;   // e.g., "/?key=...&ip=1.2.3.4"

        explicit ParsedURL(const std::string &url);

        // Extra header lines, e.g. {"Authorization", "Basic ..."}.
        std::string toGetRequestString(const std::vector<std::pair<std::string, std::string>> &headers = {}) const;
    };
} // namespace geoip
