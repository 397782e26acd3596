#include "geo_resolver.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

using namespace geoip;
using namespace geoip::fakes;

namespace {

const std::string kAddr = "131.255.7.26";

// What lookup() should return: geography from one answer, network from another.
ConsensusResult expected(const SourcedRecord& geo, const SourcedRecord& net,
                         const std::string& region) {
    ConsensusResult r;
    r.continent = geo.location.continent;
    r.country = geo.location.country;
    r.state = geo.location.state;
    r.city = geo.location.city;
    r.region = region;
    r.normalized_region = normalize_region(region);
    r.normalized_city = geo.location.normalized_city;
    r.asn = net.location.asn;
    r.latitude = geo.location.latitude;
    r.longitude = geo.location.longitude;
    r.network = net.location.network;
    r.normalized_network = net.location.normalized_network;
    return r;
}

class GeoResolverTest : public ::testing::Test {
protected:
    GeoResolver make(const Answers& answers, std::shared_ptr<const Allowlist> allow = nullptr) {
        return GeoResolver(fake_sources(answers), cache_, std::move(allow), 60, &diag_);
    }

    // Returns the error kind lookup() failed with; fails the test if it succeeded.
    GeoError lookup_error(const GeoResolver& r, const std::string& addr = kAddr) {
        try {
            r.lookup(addr);
        } catch (const GeoError& e) {
            return e;
        }
        ADD_FAILURE() << "lookup unexpectedly succeeded";
        return GeoError(ErrorKind::InternalConsistency, "none");
    }

    NullCache cache_;
    DiagLogger diag_{"/dev/null", LogLevel::Debug};
};

TEST_F(GeoResolverTest, AllProvidersAgreeUsesTopPriorityNetwork) {
    auto r = make({dallas(1), dallas(2), dallas(3), dallas(4), dallas(5)});
    auto info = r.lookup(kAddr);

    EXPECT_EQ(info, expected(dallas(1), dallas(1), "Northern America"));
    EXPECT_EQ(info.city, "Dallas");
    ASSERT_TRUE(info.state.has_value());
    EXPECT_EQ(*info.state, "TX");
    EXPECT_EQ(info.asn, 20001u);
    EXPECT_EQ(info.network, "The Constant Company LLC");
    EXPECT_EQ(info.normalized_network, "the constant company llc");
}

TEST_F(GeoResolverTest, MajorityWinsRegardlessOfWhichProvidersHoldIt) {
    auto r = make({dallas(1), dallas(2), argentina(3), argentina(4), argentina(5)});
    auto info = r.lookup(kAddr);

    EXPECT_EQ(info, expected(argentina(3), argentina(3), "South America"));
    EXPECT_EQ(info.country, "AR");
    EXPECT_FALSE(info.state.has_value());
    EXPECT_EQ(info.asn, 61003u);
}

TEST_F(GeoResolverTest, PairBeatsSingletonsAndKeepsWinnerNetwork) {
    auto r = make({argentina(1), argentina(2), dallas(3), new_york(4), bangkok(5)});
    EXPECT_EQ(r.lookup(kAddr), expected(argentina(1), argentina(1), "South America"));
}

TEST_F(GeoResolverTest, DownProvidersContributeNothing) {
    auto r = make({std::nullopt, std::nullopt, std::nullopt, argentina(4), argentina(5)});
    auto info = r.lookup(kAddr);

    EXPECT_EQ(info, expected(argentina(4), argentina(4), "South America"));
    EXPECT_EQ(info.country, "BR");
    EXPECT_EQ(info.network, "InterBS S.R.L. (BAEHOST)");
    EXPECT_EQ(diag_.error_count("geoip"), 3);
}

TEST_F(GeoResolverTest, MajorityOfRemainingProvidersAfterFailures) {
    // A and B down, C has no city, D and E agree: D wins, network repaired from E.
    auto r = make({std::nullopt, std::nullopt, empty_city(3), argentina(4, false), argentina(5)});
    EXPECT_EQ(r.lookup(kAddr), expected(argentina(4), argentina(5), "South America"));
}

TEST_F(GeoResolverTest, RepairsNetworkFromSameCityProvider) {
    auto r = make({argentina(1), dallas(2), new_york(3), empty_city(4), dallas(5)});
    auto info = r.lookup(kAddr);

    EXPECT_EQ(info, expected(dallas(2), dallas(5), "Northern America"));
    EXPECT_EQ(info.asn, 20005u);
    EXPECT_EQ(info.network, "psychz networks");
}

TEST_F(GeoResolverTest, RepairSkipsSameCityProvidersWithoutNetwork) {
    auto r = make({dallas(1, false), dallas(2), empty_city(3), empty_city(4), dallas(5)});
    EXPECT_EQ(r.lookup(kAddr), expected(dallas(1), dallas(5), "Northern America"));
}

TEST_F(GeoResolverTest, TieGoesToGroupWithHigherPriorityProvider) {
    auto r = make({empty_city(1), argentina(2), new_york(3), argentina(4), new_york(5)});
    auto info = r.lookup(kAddr);

    EXPECT_EQ(info, expected(argentina(2), argentina(4), "South America"));
    EXPECT_EQ(info.country, "AR");
}

TEST_F(GeoResolverTest, AllDifferentCitiesPicksTopPriority) {
    auto r = make({argentina(1), dallas(2), new_york(3), empty_city(4), bangkok(5)});
    EXPECT_EQ(r.lookup(kAddr), expected(argentina(1), argentina(1), "South America"));
}

TEST_F(GeoResolverTest, SkipsProvidersWithoutCity) {
    auto r = make({empty_city(1), empty_city(2), empty_city(3), dallas(4), dallas(5)});
    auto info = r.lookup(kAddr);

    EXPECT_EQ(info, expected(dallas(4), dallas(4), "Northern America"));
    EXPECT_EQ(info.network, "Psychz Networks");
}

TEST_F(GeoResolverTest, SingleProviderOtherThanFastlyIsEnough) {
    auto r = make({empty_city(1), empty_city(2), empty_city(3), argentina(4), empty_city(5)});
    EXPECT_EQ(r.lookup(kAddr), expected(argentina(4), argentina(4), "South America"));
}

TEST_F(GeoResolverTest, FastlyAloneCannotEstablishCity) {
    auto r = make({std::nullopt, std::nullopt, std::nullopt, std::nullopt, dallas(5)});
    GeoError e = lookup_error(r);

    EXPECT_EQ(e.kind(), ErrorKind::UnresolvableLocation);
    EXPECT_STREQ(e.what(), "unresolvable geoip: 131.255.7.26");
    EXPECT_TRUE(e.is_public());
}

TEST_F(GeoResolverTest, FastlyAloneWithCityAmongCitylessAnswersFails) {
    auto r = make({empty_city(1), empty_city(2), empty_city(3), empty_city(4), dallas(5)});
    EXPECT_EQ(lookup_error(r).kind(), ErrorKind::UnresolvableLocation);
}

TEST_F(GeoResolverTest, NoCitiesAtAllFails) {
    auto r = make({empty_city(1), std::nullopt, empty_city(3), std::nullopt, empty_city(5)});
    EXPECT_EQ(lookup_error(r).kind(), ErrorKind::UnresolvableLocation);
}

TEST_F(GeoResolverTest, AllProvidersDownFails) {
    auto r = make({std::nullopt, std::nullopt, std::nullopt, std::nullopt, std::nullopt});
    EXPECT_STREQ(lookup_error(r).what(), "unresolvable geoip: 131.255.7.26");
}

TEST_F(GeoResolverTest, FailsWhenWinningCityHasNoNetworkAnywhere) {
    auto r = make({argentina(1), new_york(2), dallas(3, false), dallas(4, false), empty_city(5)});
    GeoError e = lookup_error(r);

    EXPECT_EQ(e.kind(), ErrorKind::UnresolvableLocation);
    EXPECT_STREQ(e.what(), "unresolvable geoip: 131.255.7.26");
}

TEST_F(GeoResolverTest, PlaceholderCityFromFastlyDoesNotVote) {
    SourcedRecord reserved = argentina(5);
    reserved.location.city.clear();
    reserved.location.normalized_city.clear();

    auto r = make({std::nullopt, dallas(2), std::nullopt, std::nullopt, reserved});
    // Dallas from B has no network and the placeholder answer has no city to match.
    EXPECT_EQ(lookup_error(r).kind(), ErrorKind::UnresolvableLocation);

    auto r2 = make({dallas(1), dallas(2), std::nullopt, std::nullopt, reserved});
    EXPECT_EQ(r2.lookup(kAddr), expected(dallas(1), dallas(1), "Northern America"));
}

TEST_F(GeoResolverTest, VotesOnNormalizedCityNotDisplayForm) {
    SourcedRecord a = record("NA", "US", std::string("NY"), "  New   York ", 40.001, -74.001, "The Constant Company LLC", 80001);
    SourcedRecord b = record("NA", "US", std::string("NY"), "NEW YORK", 40.002, -74.002, "", 0);
    auto r = make({a, b, dallas(3), dallas(4), std::nullopt});
    auto info = r.lookup(kAddr);

    EXPECT_EQ(info.city, "New York");
    EXPECT_EQ(info.normalized_city, "new york");
    EXPECT_EQ(info.asn, 80001u);
}

TEST_F(GeoResolverTest, VotesMatchNonAsciiCapitalsAgainstLowercaseAnswers) {
    SourcedRecord a = record("EU", "PT", std::nullopt, "\xC3\x93" "bidos", 39.36, -9.157, "", 0);
    SourcedRecord b = record("EU", "PT", std::nullopt, "Lisbon", 38.72, -9.139, "MEO", 3243);
    SourcedRecord d = record("EU", "PT", std::nullopt, "\xC3\x93" "bidos", 39.36, -9.157, "", 0);
    SourcedRecord e = record("EU", "PT", std::nullopt, "\xC3\xB3" "bidos", 39.36, -9.157, "nos comunicacoes", 1);
    auto r = make({a, b, std::nullopt, d, e});
    auto info = r.lookup(kAddr);

    EXPECT_EQ(info.city, "\xC3\x93" "bidos");
    EXPECT_EQ(info.normalized_city, "\xC3\xB3" "bidos");
    EXPECT_EQ(info.asn, 1u);
    EXPECT_EQ(info.network, "nos comunicacoes");
    EXPECT_EQ(info.region, "Southern Europe");
}

TEST_F(GeoResolverTest, ProxyFlagRejectsEvenWithAgreement) {
    auto r = make({with_proxy(dallas(1), true), dallas(2), dallas(3), dallas(4), dallas(5)});
    GeoError e = lookup_error(r);

    EXPECT_EQ(e.kind(), ErrorKind::VpnDetected);
    EXPECT_STREQ(e.what(), "vpn detected");
}

TEST_F(GeoResolverTest, ProxyCheckComesBeforeVoting) {
    // Would otherwise be unresolvable; the proxy verdict wins.
    auto r = make({with_proxy(empty_city(1), true), std::nullopt, std::nullopt, std::nullopt, dallas(5)});
    EXPECT_EQ(lookup_error(r).kind(), ErrorKind::VpnDetected);
}

TEST_F(GeoResolverTest, AllowlistedProxyPasses) {
    const std::string addr = "5.134.119.43";
    Answers answers{with_proxy(dallas(1), true), dallas(2), dallas(3), dallas(4), dallas(5)};

    auto rejecting = make(answers);
    EXPECT_EQ(lookup_error(rejecting, addr).kind(), ErrorKind::VpnDetected);

    auto allow = std::make_shared<const Allowlist>(Allowlist::from_lines({addr}));
    auto accepting = make(answers, allow);
    EXPECT_EQ(accepting.lookup(addr), expected(dallas(1), dallas(1), "Northern America"));
}

TEST_F(GeoResolverTest, ProxyFlagOnlyCountsFromIp2Location) {
    auto r = make({dallas(1), with_proxy(dallas(2), true), dallas(3), dallas(4), with_proxy(dallas(5), true)});
    EXPECT_NO_THROW(r.lookup(kAddr));
}

TEST_F(GeoResolverTest, WorksWithEveryCacheOperationFailing) {
    BrokenCache broken;
    GeoResolver r(fake_sources({dallas(1), dallas(2), dallas(3), dallas(4), dallas(5)}), broken, nullptr, 60, &diag_);
    auto info = r.lookup(kAddr);

    EXPECT_EQ(info, expected(dallas(1), dallas(1), "Northern America"));
    EXPECT_EQ(broken.gets.load(), 5);
    EXPECT_EQ(broken.sets.load(), 5);
    EXPECT_EQ(diag_.error_count("cache"), 10);
}

TEST_F(GeoResolverTest, SecondLookupIsServedFromCache) {
    MemoryCache mem;
    std::vector<const FakeSource*> fakes;
    GeoResolver r(fake_sources({dallas(1), dallas(2), dallas(3), dallas(4), dallas(5)}, &fakes), mem, nullptr, 60, &diag_);

    auto first = r.lookup(kAddr);
    auto second = r.lookup(kAddr);

    EXPECT_EQ(first, second);
    EXPECT_EQ(mem.size(), 5u);
    for (const auto* f : fakes) EXPECT_EQ(f->calls(), 1) << source_name(f->source());
}

TEST_F(GeoResolverTest, FailedProvidersAreNotCached) {
    MemoryCache mem;
    std::vector<const FakeSource*> fakes;
    GeoResolver r(fake_sources({dallas(1), std::nullopt, dallas(3), dallas(4), dallas(5)}, &fakes), mem, nullptr, 60, &diag_);

    r.lookup(kAddr);
    r.lookup(kAddr);

    EXPECT_EQ(mem.size(), 4u);
    EXPECT_EQ(fakes[1]->calls(), 2);
}

TEST_F(GeoResolverTest, RepeatedLookupsAreByteIdentical) {
    auto r = make({argentina(1), dallas(2), new_york(3), empty_city(4), dallas(5)});
    const std::string first = r.lookup(kAddr).to_json();
    for (int i = 0; i < 5; ++i) EXPECT_EQ(r.lookup(kAddr).to_json(), first);
}

TEST_F(GeoResolverTest, SourcesAreRankedByPriorityNotConstructionOrder) {
    GeoResolver::Sources sources;
    sources.push_back(std::make_unique<FakeSource>(Source::Fastly, argentina(5)));
    sources.push_back(std::make_unique<FakeSource>(Source::IpInfo, dallas(4)));
    GeoResolver r(std::move(sources), cache_, nullptr, 60, &diag_);

    // One vote each: ipinfo outranks fastly.
    EXPECT_EQ(r.lookup(kAddr), expected(dallas(4), dallas(4), "Northern America"));
}

TEST_F(GeoResolverTest, RejectsDuplicateSources) {
    GeoResolver::Sources sources;
    sources.push_back(std::make_unique<FakeSource>(Source::IpMap, dallas(2)));
    sources.push_back(std::make_unique<FakeSource>(Source::IpMap, dallas(2)));
    EXPECT_THROW(GeoResolver(std::move(sources), cache_, nullptr, 60), std::invalid_argument);
}

TEST(RankByCity, GroupsInFirstSeenOrderAndSortsStably) {
    std::vector<SourcedRecord> c{argentina(1), dallas(2), new_york(3), dallas(4), argentina(5)};
    for (size_t i = 0; i < c.size(); ++i) c[i].source = kSourcePriority[i];

    auto ranked = GeoResolver::rank_by_city(c);
    ASSERT_EQ(ranked.size(), 5u);
    EXPECT_EQ(ranked[0].source, Source::Ip2Location);
    EXPECT_EQ(ranked[1].source, Source::Fastly);
    EXPECT_EQ(ranked[2].source, Source::IpMap);
    EXPECT_EQ(ranked[3].source, Source::IpInfo);
    EXPECT_EQ(ranked[4].source, Source::MaxMind);
}

TEST(ChooseWinner, EmptyRankingIsInternalAndFastlyLeadIsUnresolvable) {
    try {
        GeoResolver::choose_winner({}, kAddr);
        FAIL() << "expected InternalConsistency";
    } catch (const InternalConsistency& e) {
        EXPECT_STREQ(e.what(), "internal geoip error");
    }

    SourcedRecord fastly = dallas(5);
    fastly.source = Source::Fastly;
    try {
        GeoResolver::choose_winner({fastly}, kAddr);
        FAIL() << "expected UnresolvableLocation";
    } catch (const UnresolvableLocation& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UnresolvableLocation);
        EXPECT_EQ(std::string(e.what()), "unresolvable geoip: " + kAddr);
    }

    SourcedRecord ipinfo = dallas(4);
    ipinfo.source = Source::IpInfo;
    EXPECT_EQ(GeoResolver::choose_winner({ipinfo, fastly}, kAddr).source, Source::IpInfo);
}

TEST(MatchNetwork, ZeroAsnCountsAsAbsent) {
    SourcedRecord best = dallas(1);
    best.location.asn = 0;
    auto net = GeoResolver::match_network(best, {best});
    EXPECT_FALSE(net.has_value());
}

} // namespace
