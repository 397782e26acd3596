//// ===================== File: src/geo_resolver.cpp =====================
#include "geo_resolver.hpp"
#include "geo_error.hpp"
#include "record_codec.hpp"
#include "settle_all.hpp"

#include <algorithm>
#include <functional>
#include <stdexcept>
#include <utility>

namespace geoip
{
    namespace
    {
        size_t priority_of(Source s)
        {
            auto it = std::find(kSourcePriority.begin(), kSourcePriority.end(), s);
            return static_cast<size_t>(it - kSourcePriority.begin());
        }

        std::string describe_candidates(const std::vector<SourcedRecord> &candidates)
        {
            std::string out;
            for (const auto &c : candidates)
            {
                if (!out.empty())
                    out += "; ";
                out += std::string(source_name(c.source)) + "={city=\"" + c.location.city +
                       "\" normalizedCity=\"" + c.location.normalized_city +
                       "\" country=" + c.location.country +
                       " asn=" + std::to_string(c.location.asn) +
                       " network=\"" + c.location.network + "\"}";
            }
            return out.empty() ? "none" : out;
        }
    } // namespace

    GeoResolver::GeoResolver(Sources sources, Cache &cache, std::shared_ptr<const Allowlist> allowlist,
                             int cache_ttl_seconds, DiagLogger *diag, const RegionResolver &regions)
        : sources_(std::move(sources)), cache_(cache, cache_ttl_seconds, diag),
          allowlist_(std::move(allowlist)), diag_(diag), regions_(regions)
    {
        if (!allowlist_)
            allowlist_ = std::make_shared<const Allowlist>();

        for (const auto &s : sources_)
            if (!s)
                throw std::invalid_argument("null source adapter");

        std::stable_sort(sources_.begin(), sources_.end(),
                         [](const std::unique_ptr<SourceAdapter> &a, const std::unique_ptr<SourceAdapter> &b) {
                             return priority_of(a->source()) < priority_of(b->source());
                         });
        for (size_t i = 1; i < sources_.size(); ++i)
            if (sources_[i]->source() == sources_[i - 1]->source())
                throw std::invalid_argument(std::string("duplicate source adapter: ") +
                                            source_name(sources_[i]->source()));
    }

    // Every provider through the cache, concurrently. Failed providers are dropped;
    // the survivors stay in priority order.
    std::vector<SourcedRecord> GeoResolver::query_all(const std::string &addr) const
    {
        std::vector<std::function<SourcedRecord()>> tasks;
        tasks.reserve(sources_.size());
        for (const auto &src : sources_)
        {
            const SourceAdapter *adapter = src.get();
            tasks.emplace_back([this, adapter, addr]() {
                const std::string key = std::string("geoip:") + source_name(adapter->source()) + ":" + addr;
                SourcedRecord rec = cache_.cached_query<SourcedRecord>(key, [adapter, &addr]() {
                    return adapter->query(addr);
                });
                rec.source = adapter->source();
                return rec;
            });
        }

        auto settled = settle_all(tasks);

        std::vector<SourcedRecord> fulfilled;
        for (size_t i = 0; i < settled.size(); ++i)
        {
            if (settled[i].ok())
            {
                fulfilled.push_back(std::move(*settled[i].value));
                continue;
            }
            if (diag_)
                diag_->notice_error("geoip", std::string("lookup via ") + source_name(sources_[i]->source()) +
                                                 " failed for " + addr + ": " + describe(settled[i].error));
        }
        return fulfilled;
    }

    ConsensusResult GeoResolver::lookup(const std::string &addr) const
    {
        const std::vector<SourcedRecord> results = query_all(addr);

        // The proxy verdict outranks any agreement the other providers reach.
        for (const auto &r : results)
        {
            if (r.source == Source::Ip2Location && r.is_proxy && !allowlist_->contains(addr))
            {
                if (diag_)
                    diag_->info("geoip", "rejecting " + addr + ": flagged as proxy by ip2location");
                throw VpnDetected();
            }
        }

        std::vector<SourcedRecord> with_city;
        for (const auto &r : results)
            if (r.location.has_city())
                with_city.push_back(r);

        if (with_city.empty() || (with_city.size() == 1 && with_city.front().source == Source::Fastly))
            throw UnresolvableLocation(addr);

        const std::vector<SourcedRecord> ranked = rank_by_city(with_city);
        const SourcedRecord *winner = nullptr;
        try
        {
            winner = &choose_winner(ranked, addr);
        }
        catch (const GeoError &e)
        {
            if (diag_)
                diag_->error("geoip", "failed to find a correct value for field \"normalizedCity\" for " + addr +
                                          " (" + error_kind_name(e.kind()) + "), candidates: " +
                                          describe_candidates(results));
            throw;
        }
        const SourcedRecord &best = *winner;

        auto network = match_network(best, ranked);
        if (!network)
        {
            if (diag_)
                diag_->warn("geoip", "no network data for city \"" + best.location.normalized_city + "\" of " + addr);
            throw UnresolvableLocation(addr);
        }

        const RegionInfo region = match_region(best.location);
        const LocationRecord &loc = best.location;

        ConsensusResult out;
        out.continent = loc.continent;
        out.country = loc.country;
        out.state = loc.state;
        out.city = loc.city;
        out.region = region.region;
        out.normalized_region = region.normalized_region;
        out.normalized_city = loc.normalized_city;
        out.asn = network->asn;
        out.latitude = loc.latitude;
        out.longitude = loc.longitude;
        out.network = network->network;
        out.normalized_network = network->normalized_network;

        if (diag_)
            diag_->debug("geoip", addr + " -> " + out.to_json() + " (city from " + source_name(best.source) + ")");
        return out;
    }

    std::vector<SourcedRecord> GeoResolver::rank_by_city(const std::vector<SourcedRecord> &candidates)
    {
        // Explicit first-seen ordering; the stable sort below turns it into the tie-break.
        std::vector<std::pair<std::string, std::vector<SourcedRecord>>> groups;
        for (const auto &c : candidates)
        {
            if (!c.location.has_city())
                continue;
            auto it = std::find_if(groups.begin(), groups.end(),
                                   [&](const auto &g) { return g.first == c.location.normalized_city; });
            if (it == groups.end())
                groups.emplace_back(c.location.normalized_city, std::vector<SourcedRecord>{c});
            else
                it->second.push_back(c);
        }

        std::stable_sort(groups.begin(), groups.end(), [](const auto &a, const auto &b) {
            return a.second.size() > b.second.size();
        });

        std::vector<SourcedRecord> ranked;
        for (auto &g : groups)
            for (auto &c : g.second)
                ranked.push_back(std::move(c));
        return ranked;
    }

    const SourcedRecord &GeoResolver::choose_winner(const std::vector<SourcedRecord> &ranked,
                                                    const std::string &addr)
    {
        if (ranked.empty())
            throw InternalConsistency();
        // Fastly never decides a city on its own authority.
        if (ranked.front().source == Source::Fastly)
            throw UnresolvableLocation(addr);
        return ranked.front();
    }

    std::optional<NetworkInfo> GeoResolver::match_network(const SourcedRecord &best,
                                                          const std::vector<SourcedRecord> &ranked)
    {
        const LocationRecord &b = best.location;
        if (b.has_asn() && b.has_network())
            return NetworkInfo{b.asn, b.network, b.normalized_network};

        for (const auto &c : ranked)
        {
            const LocationRecord &l = c.location;
            if (l.normalized_city == b.normalized_city && l.has_asn() && l.has_network())
                return NetworkInfo{l.asn, l.network, l.normalized_network};
        }
        return std::nullopt;
    }

    RegionInfo GeoResolver::match_region(const LocationRecord &best) const
    {
        return regions_.region_for(best.country);
    }
} // namespace geoip
