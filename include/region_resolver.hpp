// ===================== include/region_resolver.hpp =====================
#pragma once
#include "location.hpp"

#include <string>
#include <unordered_map>

namespace geoip
{
    // Country code -> continent and UN geoscheme sub-region. Built once, read-only afterwards,
    // so concurrent lookups need no locking.
    class RegionResolver
    {
    public:
        static const RegionResolver &instance();

        // Unknown codes resolve to "Unknown"/"unknown"; never throws.
        RegionInfo region_for(const std::string &country) const;
        // Two-letter continent code, empty for unknown countries.
        std::string continent_for(const std::string &country) const;
        // "Texas" -> "TX", "District of Columbia" -> "DC"; empty if not a US state name.
        std::string us_state_code(const std::string &state_name) const;

        bool knows(const std::string &country) const { return countries_.count(country) != 0; }

    private:
        RegionResolver();

        struct Country
        {
            std::string continent;
            std::string region;
        };

        std::unordered_map<std::string, Country> countries_;
        std::unordered_map<std::string, std::string> us_states_; // normalized name -> code
    };
} // namespace geoip
