// ===================== src/http_client.cpp =====================
#include "http_client.hpp"
#include "dns_resolver.hpp"
#include "geo_error.hpp"
#include "normalize.hpp"
#include "parsed_url.hpp"
#include "ssl_session.hpp"
#include "tcp_socket.hpp"

#include <cstring>
#include <openssl/evp.h>
#include <regex>
#include <stdexcept>
#include <vector>

namespace geoip
{
    namespace
    {
        std::string decode_chunked(const std::string &body)
        {
            std::string decoded;
            size_t pos = 0;
            while (pos < body.size())
            {
                size_t line_end = body.find("\r\n", pos);
                if (line_end == std::string::npos)
                    throw SourceFailure("truncated chunked body");
                std::string size_str = body.substr(pos, line_end - pos);
                size_t ext = size_str.find(';');
                if (ext != std::string::npos)
                    size_str.erase(ext);
                size_str = trim(size_str);
                if (size_str.empty() || size_str.find_first_not_of("0123456789abcdefABCDEF") != std::string::npos)
                    throw SourceFailure("bad chunk size: " + size_str);
                size_t chunk_size = std::stoul(size_str, nullptr, 16);
                pos = line_end + 2;
                if (chunk_size == 0)
                    return decoded;
                if (pos + chunk_size > body.size())
                    throw SourceFailure("truncated chunked body");
                decoded.append(body, pos, chunk_size);
                pos += chunk_size + 2; // skip CRLF
            }
            throw SourceFailure("chunked body without terminating chunk");
        }
    } // namespace

    HttpResponse parse_http_response(const std::string &raw)
    {
        static const std::regex status_re(R"(^HTTP/\d(?:\.\d)? (\d{3})[^\r\n]*)");

        size_t header_end = raw.find("\r\n\r\n");
        if (header_end == std::string::npos)
            throw SourceFailure("malformed HTTP response (no header terminator)");

        std::smatch m;
        std::string head = raw.substr(0, header_end);
        if (!std::regex_search(head, m, status_re))
            throw SourceFailure("malformed HTTP status line");

        HttpResponse resp;
        resp.status = std::stoi(m[1].str());
        size_t first_eol = head.find("\r\n");
        resp.headers = first_eol == std::string::npos ? std::string() : head.substr(first_eol + 2);
        resp.body = raw.substr(header_end + 4);

        if (to_lower_ascii(resp.headers).find("transfer-encoding: chunked") != std::string::npos)
            resp.body = decode_chunked(resp.body);
        return resp;
    }

    std::string basic_auth(const std::string &user, const std::string &password)
    {
        const std::string plain = user + ":" + password;
        std::vector<unsigned char> out(4 * ((plain.size() + 2) / 3) + 1);
        int n = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char *>(plain.data()),
                                static_cast<int>(plain.size()));
        return "Basic " + std::string(reinterpret_cast<const char *>(out.data()), static_cast<size_t>(n));
    }

    HttpResponse HttpClient::get(const std::string &url, const HttpHeaders &headers) const
    {
        std::string raw;
        std::string host = "<bad url>"; // never log the URL itself, it may carry an API key
        bool timed_out = false;
        try
        {
            ParsedURL parsed(url);
            host = parsed.host;
            const std::vector<Endpoint> endpoints = DNSResolver::resolve(parsed.host, parsed.port);
            const std::string req = parsed.toGetRequestString(headers);

            TcpSocket tcp(timeout_ms_);
            bool connected = false;
            std::string tried;
            for (const auto &ep : endpoints)
            {
                if (tcp.connectTo(ep))
                {
                    connected = true;
                    break;
                }
                tried += (tried.empty() ? "" : ", ") + ep.label() + " (" + std::strerror(tcp.lastErrno()) + ")";
            }
            if (!connected)
                throw SourceFailure("connect to " + parsed.host + " failed: " + tried);

            if (parsed.scheme == "https")
            {
                SslSession tls;
                if (!tcp.armRemaining())
                    throw SourceFailure("timed out after " + std::to_string(timeout_ms_) + "ms connecting to " + parsed.host);
                if (!tls.handshake(tcp.fd(), parsed.host))
                    throw SourceFailure("TLS handshake with " + parsed.host + " failed: " + tls.lastError());
                if (!tls.sendAll(req))
                    throw SourceFailure("TLS send to " + parsed.host + " failed");
                raw = tls.recvAll(&timed_out, [&tcp]() { return tcp.armRemaining(); });
            }
            else
            {
                if (!tcp.sendAll(req))
                    throw SourceFailure("TCP send to " + parsed.host + " failed: " + std::strerror(tcp.lastErrno()));
                raw = tcp.recvAll(&timed_out);
            }
        }
        catch (const SourceFailure &)
        {
            throw;
        }
        catch (const std::exception &e)
        {
            // bad URLs and TLS context setup
            throw SourceFailure(e.what());
        }

        if (timed_out)
            throw SourceFailure("timed out after " + std::to_string(timeout_ms_) + "ms reading from " + host);
        if (raw.empty())
            throw SourceFailure("empty response from " + host);
        return parse_http_response(raw);
    }
} // namespace geoip
