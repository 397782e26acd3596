// ===================== src/parsed_url.cpp =====================
#include "parsed_url.hpp"
#include <stdexcept>

namespace geoip
{
    ParsedURL::ParsedURL(const std::string &url)
    {
        scheme = "http"; // default
        path = "/";

        size_t scheme_end = url.find("://");
        size_t host_start = 0;
        if (scheme_end != std::string::npos)
        {
            scheme = url.substr(0, scheme_end);
            host_start = scheme_end + 3;
        }
        if (scheme != "http" && scheme != "https")
            throw std::invalid_argument("unsupported URL scheme: " + scheme);

        size_t path_start = url.find_first_of("/?", host_start);
        std::string authority;
        if (path_start != std::string::npos)
        {
            authority = url.substr(host_start, path_start - host_start);
            path = url.substr(path_start);
            if (path.front() == '?')
                path = "/" + path;
        }
        else
        {
            authority = url.substr(host_start);
        }

        port = scheme == "https" ? 443 : 80;
        size_t colon = authority.rfind(':');
        if (colon != std::string::npos && authority.find(']') == std::string::npos)
        {
            const std::string digits = authority.substr(colon + 1);
            if (digits.empty() || digits.find_first_not_of("0123456789") != std::string::npos)
                throw std::invalid_argument("bad port in URL");
            port = std::stoi(digits);
            authority = authority.substr(0, colon);
        }
        host = authority;
        if (host.empty())
            throw std::invalid_argument("URL has no host");
    }

    std::string ParsedURL::toGetRequestString(const std::vector<std::pair<std::string, std::string>> &headers) const
    {
        std::string req = std::string("GET ") + path + " HTTP/1.1\r\n" +
                          "Host: " + host + "\r\n" +
                          "Accept: application/json\r\n" +
                          "User-Agent: geoip-consensus\r\n";
        for (const auto &h : headers)
            req += h.first + ": " + h.second + "\r\n";
        return req + "Connection: close\r\n\r\n";
    }
} // namespace geoip
