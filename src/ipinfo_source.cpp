// ===================== src/ipinfo_source.cpp =====================
#include "geo_error.hpp"
#include "geo_sources.hpp"
#include "json_scrape.hpp"
#include "region_resolver.hpp"

#include <regex>
#include <utility>

namespace geoip
{
    IpInfoSource::IpInfoSource(std::shared_ptr<const HttpClient> http, std::string base_url, std::string token)
        : HttpSource(std::move(http), std::move(base_url)), token_(std::move(token))
    {
    }

    std::string IpInfoSource::url_for(const std::string &addr) const
    {
        return base_url() + "/" + addr + "?token=" + token_;
    }

    // {"ip":"1.2.3.4","city":"Dallas","region":"Texas","country":"US",
    //  "loc":"32.7831,-96.8067","org":"AS20473 The Constant Company, LLC"}
    SourcedRecord IpInfoSource::parse(const std::string &body) const
    {
        SourcedRecord rec;
        if (json::grab_bool(body, "bogon").value_or(false))
        {
            rec.location = make_location("", "", std::nullopt, "", 0, 0, "", 0);
            return rec;
        }

        auto country = json::grab_string(body, "country");
        if (!country)
            throw SourceFailure("payload has no country");

        double lat = 0, lon = 0;
        std::smatch m;
        const std::string loc = json::grab_string(body, "loc").value_or("");
        if (std::regex_match(loc, m, std::regex(R"(\s*(-?[0-9.]+)\s*,\s*(-?[0-9.]+)\s*)")))
        {
            lat = std::stod(m[1].str());
            lon = std::stod(m[2].str());
        }

        // Extract "AS<n>" prefix and the operator name from org
        uint32_t asn = 0;
        std::string network;
        const std::string org = json::grab_string(body, "org").value_or("");
        if (std::regex_match(org, m, std::regex(R"(AS(\d+)\s*(.*))")))
        {
            asn = checked_asn(std::stod(m[1].str()));
            network = m[2].str();
        }

        std::optional<std::string> state;
        if (auto region = json::grab_string(body, "region"))
            state = RegionResolver::instance().us_state_code(*region);

        rec.location = make_location("", *country, state, json::grab_string(body, "city").value_or(""),
                                     lat, lon, network, asn);
        return rec;
    }
} // namespace geoip
