// ===================== src/record_codec.cpp =====================
#include "record_codec.hpp"
#include "geo_error.hpp"
#include "json_scrape.hpp"

#include <iomanip>
#include <sstream>

namespace geoip
{
    std::string CacheCodec<SourcedRecord>::encode(const SourcedRecord &rec)
    {
        const LocationRecord &l = rec.location;
        auto str = [](const std::string &v) { return "\"" + json::escape(v) + "\""; };

        std::ostringstream oss;
        oss << std::setprecision(17);
        oss << "{\"provider\":" << str(source_name(rec.source))
            << ",\"continent\":" << str(l.continent)
            << ",\"country\":" << str(l.country)
            << ",\"state\":" << (l.state ? str(*l.state) : std::string("null"))
            << ",\"city\":" << str(l.city)
            << ",\"normalizedCity\":" << str(l.normalized_city)
            << ",\"latitude\":" << l.latitude
            << ",\"longitude\":" << l.longitude
            << ",\"network\":" << str(l.network)
            << ",\"normalizedNetwork\":" << str(l.normalized_network)
            << ",\"asn\":" << l.asn
            << ",\"isProxy\":" << (rec.is_proxy ? "true" : "false")
            << "}";
        return oss.str();
    }

    SourcedRecord CacheCodec<SourcedRecord>::decode(const std::string &text)
    {
        auto need_str = [&](const char *key) {
            auto v = json::grab_string(text, key);
            if (!v)
                throw CacheFailure(std::string("cached record lacks \"") + key + "\"");
            return *v;
        };
        auto need_num = [&](const char *key) {
            auto v = json::grab_number(text, key);
            if (!v)
                throw CacheFailure(std::string("cached record lacks \"") + key + "\"");
            return *v;
        };

        auto source = source_from_name(need_str("provider"));
        if (!source)
            throw CacheFailure("cached record has unknown provider");

        SourcedRecord rec;
        rec.source = *source;
        LocationRecord &l = rec.location;
        l.continent = need_str("continent");
        l.country = need_str("country");
        if (auto state = json::grab_string(text, "state"))
            l.state = *state;
        l.city = need_str("city");
        l.normalized_city = need_str("normalizedCity");
        l.latitude = need_num("latitude");
        l.longitude = need_num("longitude");
        l.network = need_str("network");
        l.normalized_network = need_str("normalizedNetwork");
        double asn = need_num("asn");
        if (asn < 0 || asn > 4294967295.0)
            throw CacheFailure("cached record has out-of-range asn");
        l.asn = static_cast<uint32_t>(asn);
        rec.is_proxy = json::grab_bool(text, "isProxy").value_or(false);
        return rec;
    }
} // namespace geoip
