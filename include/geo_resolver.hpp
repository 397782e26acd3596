//// ===================== File: include/geo_resolver.hpp =====================
#pragma once
#include "allowlist.hpp"
#include "cache.hpp"
#include "cache_aside.hpp"
#include "diag_logger.hpp"
#include "geo_sources.hpp"
#include "location.hpp"
#include "region_resolver.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>


namespace geoip {

// Asks every provider about an address at once, then settles on one answer:
// proxy check, majority vote over the normalized city, network repair from a
// same-city provider, and the region from the winner's country.
//
// Throws VpnDetected, UnresolvableLocation or InternalConsistency. Provider and
// cache failures are logged and otherwise ignored.
class GeoResolver {
public:
    using Sources = std::vector<std::unique_ptr<SourceAdapter>>;

    // At most one adapter per Source; they are queried and ranked in priority order
    // regardless of the order given here.
    GeoResolver(Sources sources, Cache& cache, std::shared_ptr<const Allowlist> allowlist,
                int cache_ttl_seconds, DiagLogger* diag = nullptr,
                const RegionResolver& regions = RegionResolver::instance());

    ConsensusResult lookup(const std::string& addr) const;

    // Candidates with a city, grouped by normalized city in first-seen order, groups
    // ordered by size with ties keeping that order. Input must be in priority order.
    static std::vector<SourcedRecord> rank_by_city(const std::vector<SourcedRecord>& candidates);

    // Head of the ranking. Throws InternalConsistency when empty and
    // UnresolvableLocation when it came from Fastly.
    static const SourcedRecord& choose_winner(const std::vector<SourcedRecord>& ranked,
                                              const std::string& addr);

    // Network data for the winner, borrowed from the first ranked same-city
    // candidate when the winner has none.
    static std::optional<NetworkInfo> match_network(const SourcedRecord& best,
                                                    const std::vector<SourcedRecord>& ranked);

private:
    std::vector<SourcedRecord> query_all(const std::string& addr) const;
    RegionInfo match_region(const LocationRecord& best) const;

    Sources sources_;
    CacheAside cache_;
    std::shared_ptr<const Allowlist> allowlist_;
    DiagLogger* diag_;
    const RegionResolver& regions_;
};

} // namespace geoip
