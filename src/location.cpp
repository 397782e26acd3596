// ===================== src/location.cpp =====================
#include "location.hpp"
#include "json_scrape.hpp"

#include <iomanip>
#include <sstream>

namespace geoip
{
    const char *source_name(Source s)
    {
        switch (s)
        {
        case Source::Ip2Location: return "ip2location";
        case Source::IpMap: return "ipmap";
        case Source::MaxMind: return "maxmind";
        case Source::IpInfo: return "ipinfo";
        case Source::Fastly: return "fastly";
        }
        return "unknown";
    }

    std::optional<Source> source_from_name(const std::string &name)
    {
        for (Source s : kSourcePriority)
            if (name == source_name(s))
                return s;
        return std::nullopt;
    }

    std::string ConsensusResult::to_json() const
    {
        auto str = [](const std::string &v) { return "\"" + json::escape(v) + "\""; };

        std::ostringstream oss;
        oss << std::setprecision(10);
        oss << "{\"continent\":" << str(continent)
            << ",\"country\":" << str(country)
            << ",\"state\":" << (state ? str(*state) : std::string("null"))
            << ",\"city\":" << str(city)
            << ",\"region\":" << str(region)
            << ",\"normalizedRegion\":" << str(normalized_region)
            << ",\"normalizedCity\":" << str(normalized_city)
            << ",\"asn\":" << asn
            << ",\"latitude\":" << latitude
            << ",\"longitude\":" << longitude
            << ",\"network\":" << str(network)
            << ",\"normalizedNetwork\":" << str(normalized_network)
            << "}";
        return oss.str();
    }

    bool operator==(const ConsensusResult &a, const ConsensusResult &b)
    {
        return a.continent == b.continent && a.country == b.country && a.state == b.state &&
               a.city == b.city && a.region == b.region && a.normalized_region == b.normalized_region &&
               a.normalized_city == b.normalized_city && a.asn == b.asn &&
               a.latitude == b.latitude && a.longitude == b.longitude &&
               a.network == b.network && a.normalized_network == b.normalized_network;
    }
} // namespace geoip
