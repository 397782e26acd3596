// ===================== src/tcp_socket.cpp =====================
#include "tcp_socket.hpp"
#include <cerrno>
#include <unistd.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>

namespace geoip
{
    TcpSocket::TcpSocket(int timeout_ms)
        : sockfd_(-1), timeout_ms_(timeout_ms),
          deadline_(Clock::now() + std::chrono::milliseconds(timeout_ms)), last_errno_(0)
    {
    }

    TcpSocket::~TcpSocket() { closeSocket(); }

    void TcpSocket::closeSocket()
    {
        if (sockfd_ != -1)
        {
            ::close(sockfd_);
            sockfd_ = -1;
        }
    }

    bool TcpSocket::armRemaining()
    {
        if (timeout_ms_ <= 0 || sockfd_ == -1)
            return true;

        auto left = std::chrono::duration_cast<std::chrono::microseconds>(deadline_ - Clock::now());
        if (left.count() <= 0)
        {
            last_errno_ = ETIMEDOUT;
            return false;
        }
        // On Linux SO_SNDTIMEO also bounds connect().
        timeval tv{};
        tv.tv_sec = static_cast<time_t>(left.count() / 1000000);
        tv.tv_usec = static_cast<suseconds_t>(left.count() % 1000000);
        if (::setsockopt(sockfd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0 ||
            ::setsockopt(sockfd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) != 0)
        {
            last_errno_ = errno;
            return false;
        }
        return true;
    }

    bool TcpSocket::connectTo(const Endpoint &ep)
    {
        closeSocket();
        sockfd_ = ::socket(ep.family, ep.socktype, ep.protocol);
        if (sockfd_ == -1)
        {
            last_errno_ = errno;
            return false;
        }
        if (!armRemaining())
        {
            closeSocket();
            return false;
        }
        if (::connect(sockfd_, reinterpret_cast<const sockaddr *>(&ep.addr), ep.addrlen) == 0)
            return true;
        last_errno_ = errno;
        closeSocket();
        return false;
    }

    bool TcpSocket::sendAll(const std::string &data)
    {
        if (sockfd_ == -1 || !armRemaining())
            return false;
        size_t sent = 0;
        while (sent < data.size())
        {
            ssize_t n = ::send(sockfd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0)
            {
                last_errno_ = n < 0 ? errno : EPIPE;
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    std::string TcpSocket::recvAll(bool *timed_out)
    {
        if (timed_out)
            *timed_out = false;
        std::string response;
        response.reserve(8192);
        char buf[4096];
        while (sockfd_ != -1)
        {
            if (!armRemaining())
            {
                if (timed_out)
                    *timed_out = true;
                break;
            }
            ssize_t bytes = ::recv(sockfd_, buf, sizeof(buf), 0);
            if (bytes < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            {
                last_errno_ = ETIMEDOUT;
                if (timed_out)
                    *timed_out = true;
                break;
            }
            if (bytes < 0)
                last_errno_ = errno;
            if (bytes <= 0)
                break;
            response.append(buf, static_cast<size_t>(bytes));
        }
        return response;
    }
} // namespace geoip
