// ===================== include/normalize.hpp =====================
#pragma once
#include <string>

namespace geoip
{
    std::string trim(const std::string &s);
    std::string to_lower_ascii(std::string s);
    // ASCII plus the two-byte Latin, Greek and Cyrillic capitals; other text passes through.
    std::string to_lower_utf8(const std::string &s);

    // Display form: trimmed, internal whitespace collapsed to single spaces.
    std::string normalize_city_public(const std::string &city);
    // Equality key for votes: whitespace collapsed, case folded.
    // Always derived from the raw city, never from a display form.
    std::string normalize_city(const std::string &city);
    std::string normalize_network(const std::string &network);
    std::string normalize_region(const std::string &region);
} // namespace geoip
