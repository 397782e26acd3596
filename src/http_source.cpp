// ===================== src/http_source.cpp =====================
#include "config.hpp"
#include "geo_error.hpp"
#include "geo_sources.hpp"
#include "normalize.hpp"
#include "region_resolver.hpp"

#include <exception>
#include <utility>

namespace geoip
{
    HttpSource::HttpSource(std::shared_ptr<const HttpClient> http, std::string base_url)
        : http_(std::move(http)), base_url_(std::move(base_url))
    {
        while (!base_url_.empty() && base_url_.back() == '/')
            base_url_.pop_back();
    }

    SourcedRecord HttpSource::query(const std::string &addr) const
    {
        const std::string name = source_name(source());
        HttpResponse resp = http_->get(url_for(addr), headers());
        if (resp.status != 200)
            throw SourceFailure(name + " answered HTTP " + std::to_string(resp.status));

        try
        {
            SourcedRecord rec = parse(resp.body);
            rec.source = source();
            return rec;
        }
        catch (const SourceFailure &e)
        {
            throw SourceFailure(name + ": " + e.what());
        }
        catch (const std::exception &e)
        {
            // stod/stoul inside the scrapers on garbage input
            throw SourceFailure(name + ": malformed payload (" + e.what() + ")");
        }
    }

    LocationRecord make_location(const std::string &continent, const std::string &country,
                                 const std::optional<std::string> &state, const std::string &city,
                                 double latitude, double longitude,
                                 const std::string &network, uint32_t asn)
    {
        LocationRecord loc;
        loc.country = trim(country);
        loc.continent = continent.empty() ? RegionResolver::instance().continent_for(loc.country) : continent;
        if (loc.country == "US" && state && !trim(*state).empty())
            loc.state = trim(*state);
        loc.city = normalize_city_public(city);
        loc.normalized_city = normalize_city(city);
        loc.latitude = latitude;
        loc.longitude = longitude;
        loc.network = trim(network);
        loc.normalized_network = normalize_network(network);
        loc.asn = asn;
        return loc;
    }

    uint32_t checked_asn(double asn)
    {
        if (!(asn > 0))
            return 0;
        if (asn > 4294967295.0)
            throw SourceFailure("asn out of range");
        return static_cast<uint32_t>(asn);
    }

    std::vector<std::unique_ptr<SourceAdapter>> make_sources(const Config &cfg,
                                                              std::shared_ptr<const HttpClient> http)
    {
        std::vector<std::unique_ptr<SourceAdapter>> sources;
        sources.push_back(std::make_unique<Ip2LocationSource>(http, cfg.ip2location_url, cfg.ip2location_key));
        sources.push_back(std::make_unique<IpMapSource>(http, cfg.ipmap_url));
        sources.push_back(std::make_unique<MaxMindSource>(http, cfg.maxmind_url, cfg.maxmind_account, cfg.maxmind_license));
        sources.push_back(std::make_unique<IpInfoSource>(http, cfg.ipinfo_url, cfg.ipinfo_token));
        sources.push_back(std::make_unique<FastlySource>(http, cfg.fastly_url));
        return sources;
    }
} // namespace geoip
