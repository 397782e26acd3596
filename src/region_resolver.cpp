// ===================== src/region_resolver.cpp =====================
#include "region_resolver.hpp"
#include "normalize.hpp"

#include <utility>

namespace geoip
{
    namespace
    {
        struct CountryRow
        {
            const char *code;
            const char *continent;
            const char *region;
        };

        const CountryRow kCountries[] = {
            // Africa
            {"DZ", "AF", "Northern Africa"}, {"EG", "AF", "Northern Africa"}, {"LY", "AF", "Northern Africa"},
            {"MA", "AF", "Northern Africa"}, {"SD", "AF", "Northern Africa"}, {"TN", "AF", "Northern Africa"},
            {"EH", "AF", "Northern Africa"},
            {"BI", "AF", "Eastern Africa"}, {"KM", "AF", "Eastern Africa"}, {"DJ", "AF", "Eastern Africa"},
            {"ER", "AF", "Eastern Africa"}, {"ET", "AF", "Eastern Africa"}, {"KE", "AF", "Eastern Africa"},
            {"MG", "AF", "Eastern Africa"}, {"MW", "AF", "Eastern Africa"}, {"MU", "AF", "Eastern Africa"},
            {"YT", "AF", "Eastern Africa"}, {"MZ", "AF", "Eastern Africa"}, {"RE", "AF", "Eastern Africa"},
            {"RW", "AF", "Eastern Africa"}, {"SC", "AF", "Eastern Africa"}, {"SO", "AF", "Eastern Africa"},
            {"SS", "AF", "Eastern Africa"}, {"UG", "AF", "Eastern Africa"}, {"TZ", "AF", "Eastern Africa"},
            {"ZM", "AF", "Eastern Africa"}, {"ZW", "AF", "Eastern Africa"}, {"IO", "AF", "Eastern Africa"},
            {"TF", "AF", "Eastern Africa"},
            {"AO", "AF", "Middle Africa"}, {"CM", "AF", "Middle Africa"}, {"CF", "AF", "Middle Africa"},
            {"TD", "AF", "Middle Africa"}, {"CG", "AF", "Middle Africa"}, {"CD", "AF", "Middle Africa"},
            {"GQ", "AF", "Middle Africa"}, {"GA", "AF", "Middle Africa"}, {"ST", "AF", "Middle Africa"},
            {"BW", "AF", "Southern Africa"}, {"SZ", "AF", "Southern Africa"}, {"LS", "AF", "Southern Africa"},
            {"NA", "AF", "Southern Africa"}, {"ZA", "AF", "Southern Africa"},
            {"BJ", "AF", "Western Africa"}, {"BF", "AF", "Western Africa"}, {"CV", "AF", "Western Africa"},
            {"CI", "AF", "Western Africa"}, {"GM", "AF", "Western Africa"}, {"GH", "AF", "Western Africa"},
            {"GN", "AF", "Western Africa"}, {"GW", "AF", "Western Africa"}, {"LR", "AF", "Western Africa"},
            {"ML", "AF", "Western Africa"}, {"MR", "AF", "Western Africa"}, {"NE", "AF", "Western Africa"},
            {"NG", "AF", "Western Africa"}, {"SH", "AF", "Western Africa"}, {"SN", "AF", "Western Africa"},
            {"SL", "AF", "Western Africa"}, {"TG", "AF", "Western Africa"},

            // Americas
            {"AI", "NA", "Caribbean"}, {"AG", "NA", "Caribbean"}, {"AW", "NA", "Caribbean"},
            {"BS", "NA", "Caribbean"}, {"BB", "NA", "Caribbean"}, {"BQ", "NA", "Caribbean"},
            {"VG", "NA", "Caribbean"}, {"KY", "NA", "Caribbean"}, {"CU", "NA", "Caribbean"},
            {"CW", "NA", "Caribbean"}, {"DM", "NA", "Caribbean"}, {"DO", "NA", "Caribbean"},
            {"GD", "NA", "Caribbean"}, {"GP", "NA", "Caribbean"}, {"HT", "NA", "Caribbean"},
            {"JM", "NA", "Caribbean"}, {"MQ", "NA", "Caribbean"}, {"MS", "NA", "Caribbean"},
            {"PR", "NA", "Caribbean"}, {"BL", "NA", "Caribbean"}, {"KN", "NA", "Caribbean"},
            {"LC", "NA", "Caribbean"}, {"MF", "NA", "Caribbean"}, {"VC", "NA", "Caribbean"},
            {"SX", "NA", "Caribbean"}, {"TT", "NA", "Caribbean"}, {"TC", "NA", "Caribbean"},
            {"VI", "NA", "Caribbean"},
            {"BZ", "NA", "Central America"}, {"CR", "NA", "Central America"}, {"SV", "NA", "Central America"},
            {"GT", "NA", "Central America"}, {"HN", "NA", "Central America"}, {"MX", "NA", "Central America"},
            {"NI", "NA", "Central America"}, {"PA", "NA", "Central America"},
            {"AR", "SA", "South America"}, {"BO", "SA", "South America"}, {"BV", "SA", "South America"},
            {"BR", "SA", "South America"}, {"CL", "SA", "South America"}, {"CO", "SA", "South America"},
            {"EC", "SA", "South America"}, {"FK", "SA", "South America"}, {"GF", "SA", "South America"},
            {"GY", "SA", "South America"}, {"PY", "SA", "South America"}, {"PE", "SA", "South America"},
            {"GS", "SA", "South America"}, {"SR", "SA", "South America"}, {"UY", "SA", "South America"},
            {"VE", "SA", "South America"},
            {"BM", "NA", "Northern America"}, {"CA", "NA", "Northern America"}, {"GL", "NA", "Northern America"},
            {"PM", "NA", "Northern America"}, {"US", "NA", "Northern America"}, {"UM", "NA", "Northern America"},

            // Asia
            {"KZ", "AS", "Central Asia"}, {"KG", "AS", "Central Asia"}, {"TJ", "AS", "Central Asia"},
            {"TM", "AS", "Central Asia"}, {"UZ", "AS", "Central Asia"},
            {"CN", "AS", "Eastern Asia"}, {"HK", "AS", "Eastern Asia"}, {"MO", "AS", "Eastern Asia"},
            {"KP", "AS", "Eastern Asia"}, {"JP", "AS", "Eastern Asia"}, {"MN", "AS", "Eastern Asia"},
            {"KR", "AS", "Eastern Asia"}, {"TW", "AS", "Eastern Asia"},
            {"BN", "AS", "South-eastern Asia"}, {"KH", "AS", "South-eastern Asia"}, {"ID", "AS", "South-eastern Asia"},
            {"LA", "AS", "South-eastern Asia"}, {"MY", "AS", "South-eastern Asia"}, {"MM", "AS", "South-eastern Asia"},
            {"PH", "AS", "South-eastern Asia"}, {"SG", "AS", "South-eastern Asia"}, {"TH", "AS", "South-eastern Asia"},
            {"TL", "AS", "South-eastern Asia"}, {"VN", "AS", "South-eastern Asia"},
            {"AF", "AS", "Southern Asia"}, {"BD", "AS", "Southern Asia"}, {"BT", "AS", "Southern Asia"},
            {"IN", "AS", "Southern Asia"}, {"IR", "AS", "Southern Asia"}, {"MV", "AS", "Southern Asia"},
            {"NP", "AS", "Southern Asia"}, {"PK", "AS", "Southern Asia"}, {"LK", "AS", "Southern Asia"},
            {"AM", "AS", "Western Asia"}, {"AZ", "AS", "Western Asia"}, {"BH", "AS", "Western Asia"},
            {"CY", "AS", "Western Asia"}, {"GE", "AS", "Western Asia"}, {"IQ", "AS", "Western Asia"},
            {"IL", "AS", "Western Asia"}, {"JO", "AS", "Western Asia"}, {"KW", "AS", "Western Asia"},
            {"LB", "AS", "Western Asia"}, {"OM", "AS", "Western Asia"}, {"QA", "AS", "Western Asia"},
            {"SA", "AS", "Western Asia"}, {"PS", "AS", "Western Asia"}, {"SY", "AS", "Western Asia"},
            {"TR", "AS", "Western Asia"}, {"AE", "AS", "Western Asia"}, {"YE", "AS", "Western Asia"},

            // Europe
            {"BY", "EU", "Eastern Europe"}, {"BG", "EU", "Eastern Europe"}, {"CZ", "EU", "Eastern Europe"},
            {"HU", "EU", "Eastern Europe"}, {"PL", "EU", "Eastern Europe"}, {"MD", "EU", "Eastern Europe"},
            {"RO", "EU", "Eastern Europe"}, {"RU", "EU", "Eastern Europe"}, {"SK", "EU", "Eastern Europe"},
            {"UA", "EU", "Eastern Europe"},
            {"AX", "EU", "Northern Europe"}, {"DK", "EU", "Northern Europe"}, {"EE", "EU", "Northern Europe"},
            {"FO", "EU", "Northern Europe"}, {"FI", "EU", "Northern Europe"}, {"GG", "EU", "Northern Europe"},
            {"IS", "EU", "Northern Europe"}, {"IE", "EU", "Northern Europe"}, {"IM", "EU", "Northern Europe"},
            {"JE", "EU", "Northern Europe"}, {"LV", "EU", "Northern Europe"}, {"LT", "EU", "Northern Europe"},
            {"NO", "EU", "Northern Europe"}, {"SJ", "EU", "Northern Europe"}, {"SE", "EU", "Northern Europe"},
            {"GB", "EU", "Northern Europe"},
            {"AL", "EU", "Southern Europe"}, {"AD", "EU", "Southern Europe"}, {"BA", "EU", "Southern Europe"},
            {"HR", "EU", "Southern Europe"}, {"GI", "EU", "Southern Europe"}, {"GR", "EU", "Southern Europe"},
            {"VA", "EU", "Southern Europe"}, {"IT", "EU", "Southern Europe"}, {"MT", "EU", "Southern Europe"},
            {"ME", "EU", "Southern Europe"}, {"MK", "EU", "Southern Europe"}, {"PT", "EU", "Southern Europe"},
            {"SM", "EU", "Southern Europe"}, {"RS", "EU", "Southern Europe"}, {"SI", "EU", "Southern Europe"},
            {"ES", "EU", "Southern Europe"}, {"XK", "EU", "Southern Europe"},
            {"AT", "EU", "Western Europe"}, {"BE", "EU", "Western Europe"}, {"FR", "EU", "Western Europe"},
            {"DE", "EU", "Western Europe"}, {"LI", "EU", "Western Europe"}, {"LU", "EU", "Western Europe"},
            {"MC", "EU", "Western Europe"}, {"NL", "EU", "Western Europe"}, {"CH", "EU", "Western Europe"},

            // Oceania
            {"AU", "OC", "Australia and New Zealand"}, {"CX", "OC", "Australia and New Zealand"},
            {"CC", "OC", "Australia and New Zealand"}, {"HM", "OC", "Australia and New Zealand"},
            {"NZ", "OC", "Australia and New Zealand"}, {"NF", "OC", "Australia and New Zealand"},
            {"FJ", "OC", "Melanesia"}, {"NC", "OC", "Melanesia"}, {"PG", "OC", "Melanesia"},
            {"SB", "OC", "Melanesia"}, {"VU", "OC", "Melanesia"},
            {"GU", "OC", "Micronesia"}, {"KI", "OC", "Micronesia"}, {"MH", "OC", "Micronesia"},
            {"FM", "OC", "Micronesia"}, {"NR", "OC", "Micronesia"}, {"MP", "OC", "Micronesia"},
            {"PW", "OC", "Micronesia"},
            {"AS", "OC", "Polynesia"}, {"CK", "OC", "Polynesia"}, {"PF", "OC", "Polynesia"},
            {"NU", "OC", "Polynesia"}, {"PN", "OC", "Polynesia"}, {"WS", "OC", "Polynesia"},
            {"TK", "OC", "Polynesia"}, {"TO", "OC", "Polynesia"}, {"TV", "OC", "Polynesia"},
            {"WF", "OC", "Polynesia"},

            {"AQ", "AN", "Antarctica"},
        };

        const std::pair<const char *, const char *> kUsStates[] = {
            {"Alabama", "AL"}, {"Alaska", "AK"}, {"Arizona", "AZ"}, {"Arkansas", "AR"},
            {"California", "CA"}, {"Colorado", "CO"}, {"Connecticut", "CT"}, {"Delaware", "DE"},
            {"District of Columbia", "DC"}, {"Florida", "FL"}, {"Georgia", "GA"}, {"Hawaii", "HI"},
            {"Idaho", "ID"}, {"Illinois", "IL"}, {"Indiana", "IN"}, {"Iowa", "IA"},
            {"Kansas", "KS"}, {"Kentucky", "KY"}, {"Louisiana", "LA"}, {"Maine", "ME"},
            {"Maryland", "MD"}, {"Massachusetts", "MA"}, {"Michigan", "MI"}, {"Minnesota", "MN"},
            {"Mississippi", "MS"}, {"Missouri", "MO"}, {"Montana", "MT"}, {"Nebraska", "NE"},
            {"Nevada", "NV"}, {"New Hampshire", "NH"}, {"New Jersey", "NJ"}, {"New Mexico", "NM"},
            {"New York", "NY"}, {"North Carolina", "NC"}, {"North Dakota", "ND"}, {"Ohio", "OH"},
            {"Oklahoma", "OK"}, {"Oregon", "OR"}, {"Pennsylvania", "PA"}, {"Rhode Island", "RI"},
            {"South Carolina", "SC"}, {"South Dakota", "SD"}, {"Tennessee", "TN"}, {"Texas", "TX"},
            {"Utah", "UT"}, {"Vermont", "VT"}, {"Virginia", "VA"}, {"Washington", "WA"},
            {"West Virginia", "WV"}, {"Wisconsin", "WI"}, {"Wyoming", "WY"},
        };
    } // namespace

    RegionResolver::RegionResolver()
    {
        for (const auto &row : kCountries)
            countries_.emplace(row.code, Country{row.continent, row.region});
        for (const auto &st : kUsStates)
            us_states_.emplace(normalize_region(st.first), st.second);
    }

    const RegionResolver &RegionResolver::instance()
    {
        static const RegionResolver table;
        return table;
    }

    RegionInfo RegionResolver::region_for(const std::string &country) const
    {
        auto it = countries_.find(country);
        std::string region = it == countries_.end() ? "Unknown" : it->second.region;
        return RegionInfo{region, normalize_region(region)};
    }

    std::string RegionResolver::continent_for(const std::string &country) const
    {
        auto it = countries_.find(country);
        return it == countries_.end() ? std::string() : it->second.continent;
    }

    std::string RegionResolver::us_state_code(const std::string &state_name) const
    {
        auto it = us_states_.find(normalize_region(state_name));
        return it == us_states_.end() ? std::string() : it->second;
    }
} // namespace geoip
