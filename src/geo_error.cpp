// ===================== src/geo_error.cpp =====================
#include "geo_error.hpp"

namespace geoip
{
    const char *error_kind_name(ErrorKind k)
    {
        switch (k)
        {
        case ErrorKind::SourceFailure: return "source_failure";
        case ErrorKind::CacheFailure: return "cache_failure";
        case ErrorKind::VpnDetected: return "vpn_detected";
        case ErrorKind::UnresolvableLocation: return "unresolvable_location";
        case ErrorKind::InternalConsistency: return "internal_consistency";
        }
        return "unknown";
    }
} // namespace geoip
