// ===================== include/ssl_session.hpp =====================
#pragma once
#include <functional>
#include <string>
#include <openssl/ssl.h>

namespace geoip
{
    // One TLS client connection over an already-connected socket. Peer certificates are
    // verified against the system trust store and the requested hostname.
    class SslSession
    {
        SSL_CTX *ctx_;
        SSL *ssl_;
        std::string error_;

    public:
        SslSession();
        ~SslSession();

        SslSession(const SslSession &) = delete;
        SslSession &operator=(const SslSession &) = delete;

        bool handshake(int sockfd, const std::string &hostname);
        bool sendAll(const std::string &data) const;
        // before_read runs ahead of every SSL_read; returning false ends the read as a timeout.
        std::string recvAll(bool *timed_out = nullptr, const std::function<bool()> &before_read = nullptr) const;

        // OpenSSL's reason for the last failed handshake.
        const std::string &lastError() const { return error_; }
    };
} // namespace geoip
