// ===================== src/json_scrape.cpp =====================
#include "json_scrape.hpp"

#include <cstdint>
#include <cstdio>
#include <regex>
#include <stdexcept>

namespace geoip::json
{
    namespace
    {
        const char *const kSpace = " \t\r\n";

        // i points at an opening quote; returns the index of the closing one.
        size_t skip_string(const std::string &s, size_t i)
        {
            for (size_t j = i + 1; j < s.size(); ++j)
            {
                if (s[j] == '\\')
                    ++j;
                else if (s[j] == '"')
                    return j;
            }
            return std::string::npos;
        }

        // Returns one past the end of the value starting at i.
        size_t skip_value(const std::string &s, size_t i)
        {
            if (s[i] == '"')
            {
                size_t end = skip_string(s, i);
                return end == std::string::npos ? end : end + 1;
            }
            if (s[i] == '{' || s[i] == '[')
            {
                int depth = 0;
                for (size_t j = i; j < s.size(); ++j)
                {
                    char c = s[j];
                    if (c == '"')
                    {
                        j = skip_string(s, j);
                        if (j == std::string::npos)
                            return j;
                    }
                    else if (c == '{' || c == '[')
                        ++depth;
                    else if (c == '}' || c == ']')
                    {
                        if (--depth == 0)
                            return j + 1;
                    }
                }
                return std::string::npos;
            }
            size_t end = s.find_first_of(",}] \t\r\n", i);
            return end == std::string::npos ? s.size() : end;
        }

        void append_utf8(std::string &out, uint32_t cp)
        {
            if (cp < 0x80)
                out += static_cast<char>(cp);
            else if (cp < 0x800)
            {
                out += static_cast<char>(0xC0 | (cp >> 6));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            else if (cp < 0x10000)
            {
                out += static_cast<char>(0xE0 | (cp >> 12));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
            else
            {
                out += static_cast<char>(0xF0 | (cp >> 18));
                out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
                out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
                out += static_cast<char>(0x80 | (cp & 0x3F));
            }
        }

        // Exactly four hex digits starting at pos.
        uint32_t read_hex4(const std::string &s, size_t pos)
        {
            if (pos + 4 > s.size())
                throw std::invalid_argument("truncated \\u escape");
            uint32_t v = 0;
            for (size_t k = pos; k < pos + 4; ++k)
            {
                const char c = s[k];
                v <<= 4;
                if (c >= '0' && c <= '9')
                    v |= static_cast<uint32_t>(c - '0');
                else if (c >= 'a' && c <= 'f')
                    v |= static_cast<uint32_t>(c - 'a' + 10);
                else if (c >= 'A' && c <= 'F')
                    v |= static_cast<uint32_t>(c - 'A' + 10);
                else
                    throw std::invalid_argument("bad hex digit in \\u escape: " + s.substr(pos, 4));
            }
            return v;
        }
    } // namespace

    std::optional<std::string> raw_member(const std::string &object, const std::string &key)
    {
        size_t i = object.find_first_not_of(kSpace);
        if (i == std::string::npos || object[i] != '{')
            return std::nullopt;

        int depth = 0;
        bool expect_key = false;
        for (; i < object.size(); ++i)
        {
            char c = object[i];
            if (c == '"')
            {
                size_t end = skip_string(object, i);
                if (end == std::string::npos)
                    return std::nullopt;
                if (depth == 1 && expect_key)
                {
                    std::string k = unescape(object.substr(i + 1, end - i - 1));
                    size_t colon = object.find_first_not_of(kSpace, end + 1);
                    if (colon == std::string::npos || object[colon] != ':')
                        return std::nullopt;
                    size_t vstart = object.find_first_not_of(kSpace, colon + 1);
                    if (vstart == std::string::npos)
                        return std::nullopt;
                    size_t vend = skip_value(object, vstart);
                    if (vend == std::string::npos)
                        return std::nullopt;
                    if (k == key)
                        return object.substr(vstart, vend - vstart);
                    expect_key = false;
                    i = vend - 1;
                    continue;
                }
                i = end;
                continue;
            }
            if (c == '{' || c == '[')
            {
                ++depth;
                if (depth == 1)
                    expect_key = true;
            }
            else if (c == '}' || c == ']')
            {
                if (--depth == 0)
                    break;
            }
            else if (c == ',' && depth == 1)
                expect_key = true;
        }
        return std::nullopt;
    }

    std::optional<std::string> grab_string(const std::string &object, const std::string &key)
    {
        auto raw = raw_member(object, key);
        if (!raw || raw->size() < 2 || raw->front() != '"')
            return std::nullopt;
        return unescape(raw->substr(1, raw->size() - 2));
    }

    std::optional<double> grab_number(const std::string &object, const std::string &key)
    {
        static const std::regex number_re(R"(-?[0-9]+(\.[0-9]+)?([eE][-+]?[0-9]+)?)");

        auto raw = raw_member(object, key);
        if (!raw)
            return std::nullopt;
        std::string text = *raw;
        if (text.size() >= 2 && text.front() == '"')
            text = text.substr(1, text.size() - 2);
        if (!std::regex_match(text, number_re))
            return std::nullopt;
        return std::stod(text);
    }

    std::optional<bool> grab_bool(const std::string &object, const std::string &key)
    {
        auto raw = raw_member(object, key);
        if (!raw)
            return std::nullopt;
        if (*raw == "true")
            return true;
        if (*raw == "false")
            return false;
        return std::nullopt;
    }

    std::optional<std::string> grab_object(const std::string &object, const std::string &key)
    {
        auto raw = raw_member(object, key);
        if (!raw || raw->front() != '{')
            return std::nullopt;
        return raw;
    }

    std::optional<std::string> grab_array(const std::string &object, const std::string &key)
    {
        auto raw = raw_member(object, key);
        if (!raw || raw->front() != '[')
            return std::nullopt;
        return raw;
    }

    std::optional<std::string> first_element(const std::string &array)
    {
        size_t open = array.find_first_not_of(kSpace);
        if (open == std::string::npos || array[open] != '[')
            return std::nullopt;
        size_t start = array.find_first_not_of(kSpace, open + 1);
        if (start == std::string::npos || array[start] == ']')
            return std::nullopt;
        size_t end = skip_value(array, start);
        if (end == std::string::npos)
            return std::nullopt;
        return array.substr(start, end - start);
    }

    std::string escape(const std::string &s)
    {
        std::string out;
        out.reserve(s.size() + 2);
        for (unsigned char c : s)
        {
            switch (c)
            {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20)
                {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                }
                else
                    out += static_cast<char>(c);
            }
        }
        return out;
    }

    std::string unescape(const std::string &s)
    {
        std::string out;
        out.reserve(s.size());
        for (size_t i = 0; i < s.size(); ++i)
        {
            if (s[i] != '\\' || i + 1 >= s.size())
            {
                out += s[i];
                continue;
            }
            char e = s[++i];
            switch (e)
            {
            case 'n': out += '\n'; break;
            case 'r': out += '\r'; break;
            case 't': out += '\t'; break;
            case 'b': out += '\b'; break;
            case 'f': out += '\f'; break;
            case 'u':
            {
                uint32_t cp = read_hex4(s, i + 1);
                i += 4;
                if (cp >= 0xDC00 && cp <= 0xDFFF)
                    throw std::invalid_argument("unpaired low surrogate in \\u escape");
                if (cp >= 0xD800 && cp <= 0xDBFF)
                {
                    // UTF-16 pair: the low half must follow as a second escape
                    if (i + 2 >= s.size() || s[i + 1] != '\\' || s[i + 2] != 'u')
                        throw std::invalid_argument("unpaired high surrogate in \\u escape");
                    uint32_t low = read_hex4(s, i + 3);
                    if (low < 0xDC00 || low > 0xDFFF)
                        throw std::invalid_argument("unpaired high surrogate in \\u escape");
                    cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                    i += 6;
                }
                append_utf8(out, cp);
                break;
            }
            default: out += e; // \" \\ \/
            }
        }
        return out;
    }
} // namespace geoip::json
