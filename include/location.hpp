// ===================== include/location.hpp =====================
#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>

namespace geoip
{
    // Priority order, highest first. Used for vote tie-breaks and the network repair scan.
    enum class Source
    {
        Ip2Location, // A
        IpMap,       // B
        MaxMind,     // C
        IpInfo,      // D
        Fastly       // E, never establishes a city on its own
    };

    constexpr std::array<Source, 5> kSourcePriority{
        Source::Ip2Location, Source::IpMap, Source::MaxMind, Source::IpInfo, Source::Fastly};

    const char *source_name(Source s);
    std::optional<Source> source_from_name(const std::string &name);

    struct LocationRecord
    {
        std::string continent;
        std::string country;
        std::optional<std::string> state; // US only
        std::string city;
        std::string normalized_city;
        double latitude{};
        double longitude{};
        std::string network;
        std::string normalized_network;
        uint32_t asn{}; // 0 = absent

        bool has_city() const { return !city.empty() && !normalized_city.empty(); }
        bool has_network() const { return !network.empty(); }
        bool has_asn() const { return asn != 0; }
    };

    struct SourcedRecord
    {
        Source source{};
        LocationRecord location;
        bool is_proxy{}; // only reported by Source::Ip2Location
    };

    struct RegionInfo
    {
        std::string region;
        std::string normalized_region;
    };

    struct NetworkInfo
    {
        uint32_t asn{};
        std::string network;
        std::string normalized_network;
    };

    struct ConsensusResult
    {
        std::string continent;
        std::string country;
        std::optional<std::string> state;
        std::string city;
        std::string region;
        std::string normalized_region;
        std::string normalized_city;
        uint32_t asn{};
        double latitude{};
        double longitude{};
        std::string network;
        std::string normalized_network;

        // Fixed key order so identical results serialize identically.
        std::string to_json() const;
    };

    bool operator==(const ConsensusResult &a, const ConsensusResult &b);
} // namespace geoip
