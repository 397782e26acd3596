// ===================== src/allowlist.cpp =====================
#include "allowlist.hpp"
#include "diag_logger.hpp"
#include "normalize.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cstring>
#include <fstream>
#include <netinet/in.h>
#include <sys/socket.h>

namespace geoip
{
    namespace
    {
        // Parses a bare address into family + 16-byte buffer (IPv4 uses the first 4 bytes).
        bool parse_addr(const std::string &text, int &family, std::array<uint8_t, 16> &bytes)
        {
            bytes.fill(0);
            in_addr v4{};
            if (inet_pton(AF_INET, text.c_str(), &v4) == 1)
            {
                family = AF_INET;
                std::memcpy(bytes.data(), &v4, sizeof(v4));
                return true;
            }
            in6_addr v6{};
            if (inet_pton(AF_INET6, text.c_str(), &v6) == 1)
            {
                family = AF_INET6;
                std::memcpy(bytes.data(), &v6, sizeof(v6));
                return true;
            }
            return false;
        }

        // ::ffff:a.b.c.d is the IPv4 address a.b.c.d seen through a dual-stack socket.
        void unmap_v4(int &family, std::array<uint8_t, 16> &bytes)
        {
            static const uint8_t prefix[12] = {0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0xFF, 0xFF};
            if (family != AF_INET6 || std::memcmp(bytes.data(), prefix, sizeof(prefix)) != 0)
                return;
            std::memmove(bytes.data(), bytes.data() + 12, 4);
            std::fill(bytes.begin() + 4, bytes.end(), 0);
            family = AF_INET;
        }
    } // namespace

    std::optional<Allowlist::Range> Allowlist::parse_range(const std::string &text)
    {
        Range r{};
        std::string addr = text;
        int prefix = -1;

        size_t slash = text.find('/');
        if (slash != std::string::npos)
        {
            addr = text.substr(0, slash);
            const std::string bits = text.substr(slash + 1);
            if (bits.empty() || bits.size() > 3 || bits.find_first_not_of("0123456789") != std::string::npos)
                return std::nullopt;
            prefix = std::stoi(bits);
        }

        if (!parse_addr(addr, r.family, r.bytes))
            return std::nullopt;

        const int max_bits = r.family == AF_INET ? 32 : 128;
        if (prefix > max_bits)
            return std::nullopt;
        r.prefix = prefix < 0 ? max_bits : prefix;
        return r;
    }

    bool Allowlist::matches(const Range &r, int family, const std::array<uint8_t, 16> &bytes)
    {
        if (r.family != family)
            return false;
        int full = r.prefix / 8;
        if (std::memcmp(r.bytes.data(), bytes.data(), static_cast<size_t>(full)) != 0)
            return false;
        int rest = r.prefix % 8;
        if (rest == 0)
            return true;
        uint8_t mask = static_cast<uint8_t>(0xFF << (8 - rest));
        return (r.bytes[full] & mask) == (bytes[full] & mask);
    }

    Allowlist Allowlist::from_lines(const std::vector<std::string> &lines, DiagLogger *diag)
    {
        Allowlist list;
        for (const auto &raw : lines)
        {
            std::string line = raw;
            size_t hash = line.find('#');
            if (hash != std::string::npos)
                line.erase(hash);
            line = trim(line);
            if (line.empty())
                continue;

            auto r = parse_range(line);
            if (!r)
            {
                if (diag)
                    diag->warn("allowlist", "skipping unparsable entry: " + line);
                continue;
            }
            list.ranges_.push_back(*r);
        }
        return list;
    }

    Allowlist Allowlist::load(const std::string &path, DiagLogger *diag)
    {
        std::ifstream in(path);
        if (!in.is_open())
        {
            if (diag)
                diag->warn("allowlist", "cannot open " + path + ", allowlist is empty");
            return Allowlist{};
        }

        std::vector<std::string> lines;
        std::string line;
        while (std::getline(in, line))
            lines.push_back(line);

        Allowlist list = from_lines(lines, diag);
        if (diag)
            diag->info("allowlist", "loaded " + std::to_string(list.size()) + " entries from " + path);
        return list;
    }

    bool Allowlist::contains(const std::string &addr) const
    {
        int family = 0;
        std::array<uint8_t, 16> bytes{};
        if (!parse_addr(trim(addr), family, bytes))
            return false;
        unmap_v4(family, bytes);
        for (const auto &r : ranges_)
            if (matches(r, family, bytes))
                return true;
        return false;
    }
} // namespace geoip
