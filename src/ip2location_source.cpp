// ===================== src/ip2location_source.cpp =====================
#include "geo_error.hpp"
#include "geo_sources.hpp"
#include "json_scrape.hpp"
#include "region_resolver.hpp"

#include <utility>

namespace geoip
{
    namespace
    {
        // ip2location uses "-" for fields it does not know.
        std::string known(const std::optional<std::string> &v)
        {
            return (!v || *v == "-") ? std::string() : *v;
        }
    } // namespace

    Ip2LocationSource::Ip2LocationSource(std::shared_ptr<const HttpClient> http, std::string base_url,
                                         std::string api_key)
        : HttpSource(std::move(http), std::move(base_url)), api_key_(std::move(api_key))
    {
    }

    std::string Ip2LocationSource::url_for(const std::string &addr) const
    {
        return base_url() + "/?key=" + api_key_ + "&ip=" + addr;
    }

    // Example: {"ip":"1.2.3.4","country_code":"US","region_name":"Texas","city_name":"Dallas",
    //           "latitude":32.78,"longitude":-96.8,"asn":"20473","as":"The Constant Company LLC","is_proxy":false}
    SourcedRecord Ip2LocationSource::parse(const std::string &body) const
    {
        if (auto err = json::grab_object(body, "error"))
            throw SourceFailure("api error: " + json::grab_string(*err, "error_message").value_or("unknown"));

        const std::string country = known(json::grab_string(body, "country_code"));
        if (country.empty())
            throw SourceFailure("payload has no country_code");

        std::optional<std::string> state;
        const std::string region_name = known(json::grab_string(body, "region_name"));
        if (!region_name.empty())
            state = RegionResolver::instance().us_state_code(region_name);

        double asn = json::grab_number(body, "asn").value_or(0);

        SourcedRecord rec;
        rec.location = make_location("", country, state, known(json::grab_string(body, "city_name")),
                                     json::grab_number(body, "latitude").value_or(0),
                                     json::grab_number(body, "longitude").value_or(0),
                                     known(json::grab_string(body, "as")),
                                     checked_asn(asn));
        // A missing is_proxy field means "not a proxy".
        rec.is_proxy = json::grab_bool(body, "is_proxy").value_or(false);
        return rec;
    }
} // namespace geoip
