// ===================== include/http_client.hpp =====================
#pragma once
#include <string>
#include <utility>
#include <vector>

namespace geoip
{
    using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

    struct HttpResponse
    {
        int status{};
        std::string headers; // raw header block without the status line
        std::string body;    // de-chunked
    };

    // Splits a raw HTTP/1.1 response. Throws SourceFailure on a missing or garbled status line.
    HttpResponse parse_http_response(const std::string &raw);

    // "Basic <base64(user:password)>"
    std::string basic_auth(const std::string &user, const std::string &password);

    // Minimal one-shot GET over plain TCP or TLS. Every failure (DNS, connect, TLS, timeout,
    // malformed response) is thrown as SourceFailure.
    class HttpClient
    {
    public:
        explicit HttpClient(int timeout_ms = 5000) : timeout_ms_(timeout_ms) {}
        virtual ~HttpClient() = default;

        virtual HttpResponse get(const std::string &url, const HttpHeaders &headers = {}) const;

    private:
        int timeout_ms_;
    };
} // namespace geoip
