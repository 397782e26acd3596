// ===================== src/ssl_session.cpp =====================
#include "ssl_session.hpp"
#include <openssl/err.h>
#include <openssl/x509v3.h>
#include <cerrno>
#include <stdexcept>

namespace geoip
{
    namespace
    {
        std::string drain_openssl_errors()
        {
            std::string out;
            unsigned long code;
            while ((code = ERR_get_error()) != 0)
            {
                char buf[256];
                ERR_error_string_n(code, buf, sizeof(buf));
                if (!out.empty())
                    out += "; ";
                out += buf;
            }
            return out.empty() ? std::string("unknown TLS error") : out;
        }
    } // namespace

    SslSession::SslSession() : ctx_(nullptr), ssl_(nullptr)
    {
        // OpenSSL 1.1+ initializes itself on first use.
        const SSL_METHOD *method = TLS_client_method();
        ctx_ = SSL_CTX_new(method);
        if (!ctx_)
            throw std::runtime_error("Failed to create SSL_CTX: " + drain_openssl_errors());
        SSL_CTX_set_min_proto_version(ctx_, TLS1_2_VERSION);
        SSL_CTX_set_verify(ctx_, SSL_VERIFY_PEER, nullptr);
        if (SSL_CTX_set_default_verify_paths(ctx_) != 1)
        {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
            throw std::runtime_error("Failed to load system CA store: " + drain_openssl_errors());
        }
    }

    SslSession::~SslSession()
    {
        if (ssl_)
        {
            SSL_shutdown(ssl_);
            SSL_free(ssl_);
            ssl_ = nullptr;
        }
        if (ctx_)
        {
            SSL_CTX_free(ctx_);
            ctx_ = nullptr;
        }
    }

    bool SslSession::handshake(int sockfd, const std::string &hostname)
    {
        ssl_ = SSL_new(ctx_);
        if (!ssl_)
        {
            error_ = drain_openssl_errors();
            return false;
        }
        SSL_set_fd(ssl_, sockfd);
        SSL_set_tlsext_host_name(ssl_, hostname.c_str());
        SSL_set_hostflags(ssl_, X509_CHECK_FLAG_NO_PARTIAL_WILDCARDS);
        if (SSL_set1_host(ssl_, hostname.c_str()) != 1)
        {
            error_ = drain_openssl_errors();
            return false;
        }
        if (SSL_connect(ssl_) <= 0)
        {
            long verify = SSL_get_verify_result(ssl_);
            error_ = verify != X509_V_OK ? std::string("certificate verification failed: ") +
                                               X509_verify_cert_error_string(verify)
                                         : drain_openssl_errors();
            return false;
        }
        return true;
    }

    bool SslSession::sendAll(const std::string &data) const
    {
        if (!ssl_)
            return false;
        int n = SSL_write(ssl_, data.c_str(), static_cast<int>(data.size()));
        return n == static_cast<int>(data.size());
    }

    std::string SslSession::recvAll(bool *timed_out, const std::function<bool()> &before_read) const
    {
        if (timed_out)
            *timed_out = false;
        std::string response;
        response.reserve(8192);
        char buf[4096];
        while (ssl_)
        {
            if (before_read && !before_read())
            {
                if (timed_out)
                    *timed_out = true;
                break;
            }
            int bytes = SSL_read(ssl_, buf, sizeof(buf));
            if (bytes <= 0)
            {
                int err = SSL_get_error(ssl_, bytes);
                // A socket receive timeout surfaces as WANT_READ or as SYSCALL with EAGAIN.
                if (timed_out && (err == SSL_ERROR_WANT_READ ||
                                  (err == SSL_ERROR_SYSCALL && (errno == EAGAIN || errno == EWOULDBLOCK))))
                    *timed_out = true;
                ERR_clear_error();
                break;
            }
            response.append(buf, static_cast<size_t>(bytes));
        }
        return response;
    }
} // namespace geoip
