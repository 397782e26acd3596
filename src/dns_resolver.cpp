// ===================== src/dns_resolver.cpp =====================
#include "dns_resolver.hpp"
#include "geo_error.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cstring>
#include <memory>

namespace geoip
{
    namespace
    {
        struct AddrInfoDeleter
        {
            void operator()(addrinfo *p) const { freeaddrinfo(p); }
        };
        using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

        bool same_endpoint(const Endpoint &a, const Endpoint &b)
        {
            return a.family == b.family && a.addrlen == b.addrlen &&
                   std::memcmp(&a.addr, &b.addr, a.addrlen) == 0;
        }
    } // namespace

    std::string Endpoint::label() const
    {
        char host[NI_MAXHOST] = {0};
        char serv[NI_MAXSERV] = {0};
        if (getnameinfo(reinterpret_cast<const sockaddr *>(&addr), addrlen, host, sizeof(host),
                        serv, sizeof(serv), NI_NUMERICHOST | NI_NUMERICSERV) != 0)
            return "<unprintable address>";
        if (family == AF_INET6)
            return std::string("[") + host + "]:" + serv;
        return std::string(host) + ":" + serv;
    }

    std::vector<Endpoint> DNSResolver::resolve(const std::string &host, int port)
    {
        addrinfo hints{};
        hints.ai_family = AF_UNSPEC;
        hints.ai_socktype = SOCK_STREAM;
        hints.ai_flags = AI_ADDRCONFIG;

        addrinfo *raw = nullptr;
        int status = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &raw);
        AddrInfoPtr res(raw);
        if (status != 0)
            throw SourceFailure("DNS resolution failed for " + host + ": " + gai_strerror(status));

        std::vector<Endpoint> endpoints;
        for (const addrinfo *p = res.get(); p != nullptr; p = p->ai_next)
        {
            if (p->ai_addrlen > sizeof(sockaddr_storage))
                continue;
            Endpoint ep{};
            ep.family = p->ai_family;
            ep.socktype = p->ai_socktype;
            ep.protocol = p->ai_protocol;
            ep.addrlen = static_cast<socklen_t>(p->ai_addrlen);
            std::memcpy(&ep.addr, p->ai_addr, p->ai_addrlen);

            bool seen = std::any_of(endpoints.begin(), endpoints.end(),
                                    [&](const Endpoint &e) { return same_endpoint(e, ep); });
            if (!seen)
                endpoints.push_back(ep);
        }

        std::stable_partition(endpoints.begin(), endpoints.end(),
                              [](const Endpoint &ep) { return ep.family == AF_INET; });
        if (endpoints.empty())
            throw SourceFailure("DNS resolution returned no addresses for " + host);
        return endpoints;
    }
} // namespace geoip
