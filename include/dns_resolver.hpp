// ===================== include/dns_resolver.hpp =====================
#pragma once
#include <string>
#include <vector>
#include <sys/types.h>
#include <sys/socket.h>
#include <netdb.h>

namespace geoip
{
    // One connectable endpoint of a provider host.
    struct Endpoint
    {
        int family;
        int socktype;
        int protocol;
        sockaddr_storage addr;
        socklen_t addrlen;

        // "104.16.1.2:443", "[2606:4700::1]:443"
        std::string label() const;
    };

    class DNSResolver
    {
    public:
        // Stream endpoints for host:port, IPv4 first (a provider with a broken AAAA path would
        // otherwise eat the whole timeout), duplicates dropped.
        // Throws SourceFailure when the name does not resolve.
        static std::vector<Endpoint> resolve(const std::string &host, int port);
    };
} // namespace geoip
