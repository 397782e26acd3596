// ===================== include/json_scrape.hpp =====================
#pragma once
#include <optional>
#include <string>

// Just enough JSON to pull flat fields out of provider responses and cache entries.
// All lookups only see the top-level members of the object they are given; nested
// fields are reached by chaining grab_object().
namespace geoip::json
{
    // Raw text of the value stored under `key`, e.g. "\"Dallas\"", "32.1", "{...}".
    std::optional<std::string> raw_member(const std::string &object, const std::string &key);

    // Strings are unescaped and may throw like unescape().
    // null and wrongly-typed values come back as nullopt.
    std::optional<std::string> grab_string(const std::string &object, const std::string &key);
    // Accepts both 32.7 and "32.7"; some providers quote their numbers.
    std::optional<double> grab_number(const std::string &object, const std::string &key);
    std::optional<bool> grab_bool(const std::string &object, const std::string &key);
    std::optional<std::string> grab_object(const std::string &object, const std::string &key);
    std::optional<std::string> grab_array(const std::string &object, const std::string &key);

    // First element of an array's raw text, or nullopt when empty.
    std::optional<std::string> first_element(const std::string &array);

    std::string escape(const std::string &s);
    // Surrogate pairs become one 4-byte sequence. Throws std::invalid_argument on a hex escape
    // that is not four hex digits or on an unpaired surrogate.
    std::string unescape(const std::string &s);
} // namespace geoip::json
