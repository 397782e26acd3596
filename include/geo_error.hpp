// ===================== include/geo_error.hpp =====================
#pragma once
#include <stdexcept>
#include <string>

namespace geoip
{
    enum class ErrorKind
    {
        SourceFailure,
        CacheFailure,
        VpnDetected,
        UnresolvableLocation,
        InternalConsistency
    };

    const char *error_kind_name(ErrorKind k);

    class GeoError : public std::runtime_error
    {
    public:
        GeoError(ErrorKind kind, const std::string &what)
            : std::runtime_error(what), kind_(kind) {}

        ErrorKind kind() const noexcept { return kind_; }

        // VpnDetected and UnresolvableLocation may be shown to end users verbatim.
        bool is_public() const noexcept
        {
            return kind_ == ErrorKind::VpnDetected || kind_ == ErrorKind::UnresolvableLocation;
        }

    private:
        ErrorKind kind_;
    };

    // One provider's transport, status or payload error.
    class SourceFailure : public GeoError
    {
    public:
        explicit SourceFailure(const std::string &what) : GeoError(ErrorKind::SourceFailure, what) {}
    };

    // Cache backend get/set/del error, or an undecodable cached value.
    class CacheFailure : public GeoError
    {
    public:
        explicit CacheFailure(const std::string &what) : GeoError(ErrorKind::CacheFailure, what) {}
    };

    class VpnDetected : public GeoError
    {
    public:
        VpnDetected() : GeoError(ErrorKind::VpnDetected, "vpn detected") {}
    };

    class UnresolvableLocation : public GeoError
    {
    public:
        explicit UnresolvableLocation(const std::string &addr)
            : GeoError(ErrorKind::UnresolvableLocation, "unresolvable geoip: " + addr) {}
    };

    // Voting produced no usable winner. Details go to the log, not to the caller.
    class InternalConsistency : public GeoError
    {
    public:
        InternalConsistency() : GeoError(ErrorKind::InternalConsistency, "internal geoip error") {}
    };
} // namespace geoip
