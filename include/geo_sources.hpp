// ===================== include/geo_sources.hpp =====================
#pragma once
#include "http_client.hpp"
#include "location.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace geoip
{
    struct Config;

    // One geolocation provider. query() throws SourceFailure on transport, status or payload errors.
    class SourceAdapter
    {
    public:
        virtual ~SourceAdapter() = default;
        virtual Source source() const = 0;
        virtual SourcedRecord query(const std::string &addr) const = 0;
    };

    // Provider reached with a single HTTPS GET returning JSON.
    class HttpSource : public SourceAdapter
    {
    public:
        HttpSource(std::shared_ptr<const HttpClient> http, std::string base_url);

        SourcedRecord query(const std::string &addr) const override;
        // Body of a 200 response -> record. Throws SourceFailure on payloads it cannot use.
        virtual SourcedRecord parse(const std::string &body) const = 0;

    protected:
        virtual std::string url_for(const std::string &addr) const = 0;
        virtual HttpHeaders headers() const { return {}; }
        const std::string &base_url() const { return base_url_; }

    private:
        std::shared_ptr<const HttpClient> http_;
        std::string base_url_;
    };

    // Shared by every parser so the normalized forms always agree across providers.
    // `state` is kept only for US addresses; the continent falls back to the country table.
    LocationRecord make_location(const std::string &continent, const std::string &country,
                                 const std::optional<std::string> &state, const std::string &city,
                                 double latitude, double longitude,
                                 const std::string &network, uint32_t asn);

    // Non-positive means unknown (0). Throws SourceFailure past the 32-bit AS number space.
    uint32_t checked_asn(double asn);

    // A: ip2location.io, the only provider reporting proxies.
    class Ip2LocationSource : public HttpSource
    {
    public:
        Ip2LocationSource(std::shared_ptr<const HttpClient> http, std::string base_url, std::string api_key);
        Source source() const override { return Source::Ip2Location; }
        SourcedRecord parse(const std::string &body) const override;

    protected:
        std::string url_for(const std::string &addr) const override;

    private:
        std::string api_key_;
    };

    // B: RIPE IPmap. Location only, never network data.
    class IpMapSource : public HttpSource
    {
    public:
        using HttpSource::HttpSource;
        Source source() const override { return Source::IpMap; }
        SourcedRecord parse(const std::string &body) const override;

    protected:
        std::string url_for(const std::string &addr) const override;
    };

    // C: MaxMind GeoIP2 City web service, basic auth.
    class MaxMindSource : public HttpSource
    {
    public:
        MaxMindSource(std::shared_ptr<const HttpClient> http, std::string base_url,
                      std::string account_id, std::string license_key);
        Source source() const override { return Source::MaxMind; }
        SourcedRecord parse(const std::string &body) const override;

    protected:
        std::string url_for(const std::string &addr) const override;
        HttpHeaders headers() const override;

    private:
        std::string account_id_;
        std::string license_key_;
    };

    // D: ipinfo.io.
    class IpInfoSource : public HttpSource
    {
    public:
        IpInfoSource(std::shared_ptr<const HttpClient> http, std::string base_url, std::string token);
        Source source() const override { return Source::IpInfo; }
        SourcedRecord parse(const std::string &body) const override;

    protected:
        std::string url_for(const std::string &addr) const override;

    private:
        std::string token_;
    };

    // E: Fastly edge geolocation. Reports "reserved"/"private" in place of a city for
    // non-geographic ranges; those become an empty city, network data is kept.
    class FastlySource : public HttpSource
    {
    public:
        using HttpSource::HttpSource;
        Source source() const override { return Source::Fastly; }
        SourcedRecord parse(const std::string &body) const override;

    protected:
        std::string url_for(const std::string &addr) const override;
    };

    // All five providers in priority order, wired from the configuration.
    std::vector<std::unique_ptr<SourceAdapter>> make_sources(const Config &cfg,
                                                              std::shared_ptr<const HttpClient> http);
} // namespace geoip
