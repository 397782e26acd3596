// ===================== include/tcp_socket.hpp =====================
#pragma once
#include <chrono>
#include <string>
#include "dns_resolver.hpp"

namespace geoip
{
    // Client stream socket with one time budget covering connect, send and every recv.
    class TcpSocket
    {
        using Clock = std::chrono::steady_clock;

        int sockfd_;
        int timeout_ms_;
        Clock::time_point deadline_;
        int last_errno_;

    public:
        // The budget starts now; 0 means no limit.
        explicit TcpSocket(int timeout_ms = 0);
        ~TcpSocket();

        TcpSocket(const TcpSocket &) = delete;
        TcpSocket &operator=(const TcpSocket &) = delete;

        void closeSocket();
        bool connectTo(const Endpoint &ep);
        bool sendAll(const std::string &data);
        // Reads until EOF. Sets timed_out when the budget ran out first.
        std::string recvAll(bool *timed_out = nullptr);

        // Shrinks the socket timeouts to what is left of the budget. False once it is spent.
        bool armRemaining();

        int fd() const { return sockfd_; }
        // errno of the last failed connect/send/recv, 0 if none.
        int lastErrno() const { return last_errno_; }
    };
} // namespace geoip
