// ===================== src/normalize.cpp =====================
#include "normalize.hpp"

#include <cctype>
#include <cstdint>

namespace geoip
{
    namespace
    {
        std::string collapse_spaces(const std::string &s)
        {
            std::string out;
            out.reserve(s.size());
            bool pending = false;
            for (unsigned char c : s)
            {
                if (std::isspace(c))
                {
                    pending = !out.empty();
                    continue;
                }
                if (pending)
                    out += ' ';
                pending = false;
                out += static_cast<char>(c);
            }
            return out;
        }

        // Lowercase partner of a two-byte code point (U+0080..U+07FF), or cp itself.
        // Covers Latin-1 Supplement, Latin Extended-A, Greek and Cyrillic capitals.
        uint32_t fold_two_byte(uint32_t cp)
        {
            if ((cp >= 0x00C0 && cp <= 0x00DE && cp != 0x00D7) || (cp >= 0x0391 && cp <= 0x03AB && cp != 0x03A2) ||
                (cp >= 0x0410 && cp <= 0x042F))
                return cp + 0x20;
            if ((cp >= 0x0100 && cp <= 0x012F) || (cp >= 0x0132 && cp <= 0x0137) || (cp >= 0x014A && cp <= 0x0177) ||
                (cp >= 0x0460 && cp <= 0x0481) || (cp >= 0x048A && cp <= 0x04BF))
                return (cp % 2 == 0) ? cp + 1 : cp;
            if ((cp >= 0x0139 && cp <= 0x0148) || (cp >= 0x0179 && cp <= 0x017E))
                return (cp % 2 == 1) ? cp + 1 : cp;
            if (cp >= 0x0400 && cp <= 0x040F)
                return cp + 0x50;
            switch (cp)
            {
            case 0x0178: return 0x00FF; // Ÿ
            case 0x0386: return 0x03AC;
            case 0x0388: case 0x0389: case 0x038A: return cp + 0x25;
            case 0x038C: return 0x03CC;
            case 0x038E: case 0x038F: return cp + 0x3F;
            default: return cp;
            }
        }
    } // namespace

    std::string trim(const std::string &s)
    {
        const char *ws = " \t\r\n\f\v";
        size_t b = s.find_first_not_of(ws);
        if (b == std::string::npos)
            return {};
        size_t e = s.find_last_not_of(ws);
        return s.substr(b, e - b + 1);
    }

    // Bytes >= 0x80 (UTF-8 continuation/lead bytes) pass through untouched.
    std::string to_lower_ascii(std::string s)
    {
        for (auto &c : s)
        {
            if (c >= 'A' && c <= 'Z')
                c = static_cast<char>(c - 'A' + 'a');
        }
        return s;
    }

    // Three- and four-byte sequences and stray bytes are copied unchanged.
    std::string to_lower_utf8(const std::string &s)
    {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i)
        {
            unsigned char c = static_cast<unsigned char>(s[i]);
            if (c >= 'A' && c <= 'Z')
            {
                out += static_cast<char>(c - 'A' + 'a');
                continue;
            }
            unsigned char next = i + 1 < s.size() ? static_cast<unsigned char>(s[i + 1]) : 0;
            if ((c & 0xE0) != 0xC0 || (next & 0xC0) != 0x80)
            {
                out += static_cast<char>(c);
                continue;
            }
            uint32_t cp = fold_two_byte((static_cast<uint32_t>(c & 0x1F) << 6) | (next & 0x3F));
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
            ++i;
        }
        return out;
    }

    std::string normalize_city_public(const std::string &city)
    {
        return collapse_spaces(city);
    }

    std::string normalize_city(const std::string &city)
    {
        return to_lower_utf8(collapse_spaces(city));
    }

    std::string normalize_network(const std::string &network)
    {
        return to_lower_utf8(collapse_spaces(network));
    }

    std::string normalize_region(const std::string &region)
    {
        return to_lower_utf8(collapse_spaces(region));
    }
} // namespace geoip
