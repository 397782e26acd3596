// ===================== include/record_codec.hpp =====================
#pragma once
#include "cache_aside.hpp"
#include "location.hpp"

#include <string>

namespace geoip
{
    // Flat JSON object per cached provider answer.
    template <>
    struct CacheCodec<SourcedRecord>
    {
        static std::string encode(const SourcedRecord &rec);
        static SourcedRecord decode(const std::string &text);
    };
} // namespace geoip
