// ===================== include/allowlist.hpp =====================
#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace geoip
{
    class DiagLogger;

    // Addresses exempt from the proxy check. Built once before serving, never mutated after,
    // so contains() is safe from any number of threads.
    class Allowlist
    {
    public:
        Allowlist() = default;

        // Newline-separated IPv4/IPv6 addresses or CIDR ranges; '#' starts a comment.
        // Unparsable lines are logged and skipped. A missing file gives an empty list.
        static Allowlist load(const std::string &path, DiagLogger *diag = nullptr);
        static Allowlist from_lines(const std::vector<std::string> &lines, DiagLogger *diag = nullptr);

        bool contains(const std::string &addr) const;
        size_t size() const { return ranges_.size(); }

    private:
        struct Range
        {
            int family; // AF_INET / AF_INET6
            std::array<uint8_t, 16> bytes;
            int prefix; // bits
        };

        static std::optional<Range> parse_range(const std::string &text);
        static bool matches(const Range &r, int family, const std::array<uint8_t, 16> &bytes);

        std::vector<Range> ranges_;
    };
} // namespace geoip
