// ===================== src/ipmap_source.cpp =====================
#include "geo_error.hpp"
#include "geo_sources.hpp"
#include "json_scrape.hpp"

namespace geoip
{
    std::string IpMapSource::url_for(const std::string &addr) const
    {
        return base_url() + "/v1/locate/" + addr;
    }

    // {"locations":[{"cityName":"Dallas","stateAnsiCode":"TX","countryCodeAlpha2":"US",
    //                "latitude":"32.7831","longitude":"-96.8067"}]}
    // An empty locations list is a valid "don't know", not a failure.
    SourcedRecord IpMapSource::parse(const std::string &body) const
    {
        auto locations = json::grab_array(body, "locations");
        if (!locations)
            throw SourceFailure("payload has no locations array");

        SourcedRecord rec;
        auto first = json::first_element(*locations);
        if (!first)
        {
            rec.location = make_location("", "", std::nullopt, "", 0, 0, "", 0);
            return rec;
        }

        const std::string &loc = *first;
        rec.location = make_location("", json::grab_string(loc, "countryCodeAlpha2").value_or(""),
                                     json::grab_string(loc, "stateAnsiCode"),
                                     json::grab_string(loc, "cityName").value_or(""),
                                     json::grab_number(loc, "latitude").value_or(0),
                                     json::grab_number(loc, "longitude").value_or(0),
                                     "", 0);
        return rec;
    }
} // namespace geoip
