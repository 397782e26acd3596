// ===================== src/fastly_source.cpp =====================
#include "geo_error.hpp"
#include "geo_sources.hpp"
#include "json_scrape.hpp"
#include "normalize.hpp"

namespace geoip
{
    namespace
    {
        // Placeholder labels Fastly puts in geo.city for non-geographic ranges.
        bool is_placeholder_city(const std::string &city)
        {
            const std::string c = normalize_city(city);
            return c == "reserved" || c == "private";
        }
    } // namespace

    std::string FastlySource::url_for(const std::string &addr) const
    {
        return base_url() + "/" + addr;
    }

    // {"as":{"name":"interbs s.r.l.","number":61005},
    //  "geo":{"city":"buenos aires","continent_code":"SA","country_code":"AR","latitude":-34.6,"longitude":-58.4,"region":"C"}}
    SourcedRecord FastlySource::parse(const std::string &body) const
    {
        auto geo = json::grab_object(body, "geo");
        if (!geo)
            throw SourceFailure("payload has no geo section");

        std::string city = json::grab_string(*geo, "city").value_or("");
        if (is_placeholder_city(city))
            city.clear();

        std::string network;
        double asn = 0;
        if (auto as = json::grab_object(body, "as"))
        {
            network = json::grab_string(*as, "name").value_or("");
            asn = json::grab_number(*as, "number").value_or(0);
        }

        SourcedRecord rec;
        rec.location = make_location(json::grab_string(*geo, "continent_code").value_or(""),
                                     json::grab_string(*geo, "country_code").value_or(""),
                                     json::grab_string(*geo, "region"), city,
                                     json::grab_number(*geo, "latitude").value_or(0),
                                     json::grab_number(*geo, "longitude").value_or(0),
                                     network, checked_asn(asn));
        return rec;
    }
} // namespace geoip
