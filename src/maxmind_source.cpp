// ===================== src/maxmind_source.cpp =====================
#include "geo_error.hpp"
#include "geo_sources.hpp"
#include "json_scrape.hpp"

#include <utility>

namespace geoip
{
    namespace
    {
        // obj.key.names.en
        std::string english_name(const std::string &obj, const char *key)
        {
            auto section = json::grab_object(obj, key);
            if (!section)
                return {};
            auto names = json::grab_object(*section, "names");
            return names ? json::grab_string(*names, "en").value_or("") : std::string();
        }
    } // namespace

    MaxMindSource::MaxMindSource(std::shared_ptr<const HttpClient> http, std::string base_url,
                                 std::string account_id, std::string license_key)
        : HttpSource(std::move(http), std::move(base_url)),
          account_id_(std::move(account_id)), license_key_(std::move(license_key))
    {
    }

    std::string MaxMindSource::url_for(const std::string &addr) const
    {
        return base_url() + "/geoip/v2.1/city/" + addr;
    }

    HttpHeaders MaxMindSource::headers() const
    {
        return {{"Authorization", basic_auth(account_id_, license_key_)}};
    }

    SourcedRecord MaxMindSource::parse(const std::string &body) const
    {
        auto country = json::grab_object(body, "country");
        if (!country)
            throw SourceFailure("payload has no country");
        const std::string country_code = json::grab_string(*country, "iso_code").value_or("");

        std::string continent;
        if (auto c = json::grab_object(body, "continent"))
            continent = json::grab_string(*c, "code").value_or("");

        std::optional<std::string> state;
        if (auto subdivisions = json::grab_array(body, "subdivisions"))
            if (auto first = json::first_element(*subdivisions))
                state = json::grab_string(*first, "iso_code");

        double lat = 0, lon = 0;
        if (auto location = json::grab_object(body, "location"))
        {
            lat = json::grab_number(*location, "latitude").value_or(0);
            lon = json::grab_number(*location, "longitude").value_or(0);
        }

        std::string network;
        double asn = 0;
        if (auto traits = json::grab_object(body, "traits"))
        {
            network = json::grab_string(*traits, "isp").value_or("");
            asn = json::grab_number(*traits, "autonomous_system_number").value_or(0);
        }

        SourcedRecord rec;
        rec.location = make_location(continent, country_code, state, english_name(body, "city"),
                                     lat, lon, network, checked_asn(asn));
        return rec;
    }
} // namespace geoip
