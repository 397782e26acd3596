#include "allowlist.hpp"
#include "config.hpp"
#include "diag_logger.hpp"
#include "geo_error.hpp"
#include "json_scrape.hpp"
#include "location.hpp"
#include "normalize.hpp"
#include "region_resolver.hpp"
#include "settle_all.hpp"

#include <gtest/gtest.h>

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <unistd.h>

using namespace geoip;

namespace {

TEST(Normalize, CollapsesWhitespaceAndLowercases) {
    EXPECT_EQ(normalize_city_public("  San   Francisco\t"), "San Francisco");
    EXPECT_EQ(normalize_city("  San   Francisco\t"), "san francisco");
    EXPECT_EQ(normalize_city("S\xC3\xA3o Paulo"), "s\xC3\xA3o paulo");
    EXPECT_EQ(normalize_network("The Constant  Company LLC"), "the constant company llc");
    EXPECT_EQ(normalize_city(" \t "), "");
}

TEST(Normalize, FoldsNonAsciiCapitals) {
    EXPECT_EQ(normalize_city("\xC3\x93" "bidos"), "\xC3\xB3" "bidos");             // Óbidos
    EXPECT_EQ(normalize_city("\xC5\x81\xC3\xB3" "d\xC5\xBA"), "\xC5\x82\xC3\xB3" "d\xC5\xBA"); // Łódź
    EXPECT_EQ(normalize_city("\xC3\x85rhus"), "\xC3\xA5rhus");               // Århus
    EXPECT_EQ(normalize_city("\xC3\x9Cr\xC3\xBCmqi"), "\xC3\xBCr\xC3\xBCmqi"); // Ürümqi
    EXPECT_EQ(normalize_city("\xCE\x91\xCE\xB8\xCE\xAE\xCE\xBD\xCE\xB1"),
              "\xCE\xB1\xCE\xB8\xCE\xAE\xCE\xBD\xCE\xB1");               // Αθήνα
    EXPECT_EQ(normalize_city("\xD0\x9C\xD0\xBE\xD1\x81\xD0\xBA\xD0\xB2\xD0\xB0"),
              "\xD0\xBC\xD0\xBE\xD1\x81\xD0\xBA\xD0\xB2\xD0\xB0");     // Москва
    EXPECT_EQ(normalize_city("\xC3\x97"), "\xC3\x97");                        // multiplication sign
    EXPECT_EQ(normalize_city("\xE6\x9D\xB1\xE4\xBA\xAC"), "\xE6\x9D\xB1\xE4\xBA\xAC"); // 東京
}

TEST(JsonScrape, OnlyTopLevelMembersMatch) {
    const std::string body = R"({"geo":{"city":"nested"},"city":"top","n":"12.5","b":true,"z":null})";
    EXPECT_EQ(json::grab_string(body, "city").value_or(""), "top");
    EXPECT_EQ(json::grab_string(*json::grab_object(body, "geo"), "city").value_or(""), "nested");
    EXPECT_DOUBLE_EQ(json::grab_number(body, "n").value_or(0), 12.5);
    EXPECT_EQ(json::grab_bool(body, "b"), std::optional<bool>(true));
    EXPECT_FALSE(json::grab_string(body, "z").has_value());
    EXPECT_FALSE(json::grab_string(body, "missing").has_value());
}

TEST(JsonScrape, KeysInsideStringValuesAreIgnored) {
    const std::string body = R"({"note":"\"city\":\"fake\"","city":"Dallas"})";
    EXPECT_EQ(json::grab_string(body, "city").value_or(""), "Dallas");
}

TEST(JsonScrape, EscapesRoundTrip) {
    EXPECT_EQ(json::unescape(R"(a\"b\\c\u00e9\n)"), "a\"b\\c\xC3\xA9\n");
    EXPECT_EQ(json::escape("a\"b\\c\n"), R"(a\"b\\c\n)");
}

TEST(JsonScrape, SurrogatePairsBecomeOneCodePoint) {
    EXPECT_EQ(json::unescape(R"(\uD83D\uDE00)"), "\xF0\x9F\x98\x80");
    EXPECT_EQ(json::unescape(R"(S\u00e3o \ud83c\udf0e)"), "S\xC3\xA3o \xF0\x9F\x8C\x8E");
}

TEST(JsonScrape, MalformedHexEscapesAreRejected) {
    EXPECT_THROW(json::unescape(R"(\u00zz)"), std::invalid_argument);
    EXPECT_THROW(json::unescape(R"(\u12)"), std::invalid_argument);
    EXPECT_THROW(json::unescape(R"(\uD83D)"), std::invalid_argument);
    EXPECT_THROW(json::unescape(R"(\uD83Dx)"), std::invalid_argument);
    EXPECT_THROW(json::unescape(R"(\uD83D\u0041)"), std::invalid_argument);
    EXPECT_THROW(json::unescape(R"(\uDE00)"), std::invalid_argument);
}

TEST(JsonScrape, ArraysAndElements) {
    auto arr = json::grab_array(R"({"xs":[{"a":1},{"a":2}],"empty":[]})", "xs");
    ASSERT_TRUE(arr.has_value());
    auto first = json::first_element(*arr);
    ASSERT_TRUE(first.has_value());
    EXPECT_DOUBLE_EQ(json::grab_number(*first, "a").value_or(0), 1);
    EXPECT_FALSE(json::first_element("[]").has_value());
}

TEST(RegionResolver, KnownAndUnknownCountries) {
    const RegionResolver& regions = RegionResolver::instance();

    RegionInfo ar = regions.region_for("AR");
    EXPECT_EQ(ar.region, "South America");
    EXPECT_EQ(ar.normalized_region, "south america");
    EXPECT_EQ(regions.region_for("US").region, "Northern America");
    EXPECT_EQ(regions.region_for("TH").region, "South-eastern Asia");
    EXPECT_EQ(regions.continent_for("TH"), "AS");

    RegionInfo unknown = regions.region_for("XX");
    EXPECT_EQ(unknown.region, "Unknown");
    EXPECT_EQ(unknown.normalized_region, "unknown");
    EXPECT_EQ(regions.continent_for("XX"), "");
    EXPECT_FALSE(regions.knows("XX"));
}

TEST(RegionResolver, UsStateCodes) {
    const RegionResolver& regions = RegionResolver::instance();
    EXPECT_EQ(regions.us_state_code("Texas"), "TX");
    EXPECT_EQ(regions.us_state_code("new  york"), "NY");
    EXPECT_EQ(regions.us_state_code("District of Columbia"), "DC");
    EXPECT_EQ(regions.us_state_code("Buenos Aires"), "");
}

TEST(Allowlist, ExactAndCidrEntries) {
    Allowlist list = Allowlist::from_lines({
        "# vpn exit nodes we trust",
        "5.134.119.43",
        "  10.20.0.0/16   # office",
        "2001:db8::/32",
        "",
        "not-an-address",
        "1.2.3.4/33",
    });

    EXPECT_EQ(list.size(), 3u);
    EXPECT_TRUE(list.contains("5.134.119.43"));
    EXPECT_FALSE(list.contains("5.134.119.44"));
    EXPECT_TRUE(list.contains("10.20.255.1"));
    EXPECT_FALSE(list.contains("10.21.0.1"));
    EXPECT_TRUE(list.contains("2001:db8:1::5"));
    EXPECT_FALSE(list.contains("2001:db9::1"));
    EXPECT_FALSE(list.contains("garbage"));
}

TEST(Allowlist, MappedIpv4AddressesMatchIpv4Entries) {
    Allowlist list = Allowlist::from_lines({"5.134.119.43", "10.20.0.0/16"});

    EXPECT_TRUE(list.contains("::ffff:5.134.119.43"));
    EXPECT_TRUE(list.contains("::FFFF:10.20.1.1"));
    EXPECT_FALSE(list.contains("::ffff:10.21.0.1"));
    EXPECT_FALSE(list.contains("::5.134.119.43"));
}

TEST(Allowlist, LoadsFromFileAndToleratesMissingFile) {
    char path[] = "/tmp/geoip-allowlist-XXXXXX";
    int fd = mkstemp(path);
    ASSERT_NE(fd, -1);
    close(fd);
    {
        std::ofstream out(path);
        out << "131.255.7.26\n192.168.0.0/24\n";
    }

    Allowlist list = Allowlist::load(path);
    std::remove(path);
    EXPECT_EQ(list.size(), 2u);
    EXPECT_TRUE(list.contains("192.168.0.77"));

    EXPECT_EQ(Allowlist::load("/nonexistent/allowlist-ips.txt").size(), 0u);
}

TEST(Config, FlagsOverrideDefaults) {
    Config cfg;
    auto pos = cfg.apply_args({"8.8.8.8", "--ttl=60", "--timeout-ms=1500", "--log-level=debug",
                               "--allowlist=/etc/geoip/allow.txt"});
    ASSERT_EQ(pos.size(), 1u);
    EXPECT_EQ(pos[0], "8.8.8.8");
    EXPECT_EQ(cfg.cache_ttl_seconds, 60);
    EXPECT_EQ(cfg.source_timeout_ms, 1500);
    EXPECT_EQ(cfg.log_level, LogLevel::Debug);
    EXPECT_EQ(cfg.allowlist_path, "/etc/geoip/allow.txt");

    EXPECT_THROW(cfg.apply_args({"--ttl=0"}), std::invalid_argument);
    EXPECT_THROW(cfg.apply_args({"--ttl=abc"}), std::invalid_argument);
    EXPECT_THROW(cfg.apply_args({"--colour=red"}), std::invalid_argument);
    EXPECT_THROW(cfg.apply_args({"--log-level=loud"}), std::invalid_argument);
}

TEST(Config, EnvironmentOverridesDefaults) {
    setenv("GEOIP_CACHE_TTL", "120", 1);
    setenv("IPINFO_TOKEN", "tok", 1);
    Config cfg;
    cfg.apply_env();
    unsetenv("GEOIP_CACHE_TTL");
    unsetenv("IPINFO_TOKEN");

    EXPECT_EQ(cfg.cache_ttl_seconds, 120);
    EXPECT_EQ(cfg.ipinfo_token, "tok");
    EXPECT_EQ(cfg.source_timeout_ms, 5000);
}

TEST(SettleAll, CollectsEveryOutcomeInOrder) {
    std::vector<std::function<int()>> tasks = {
        [] { return 1; },
        []() -> int { throw SourceFailure("boom"); },
        [] { return 3; },
    };
    auto settled = settle_all(tasks);

    ASSERT_EQ(settled.size(), 3u);
    EXPECT_TRUE(settled[0].ok());
    EXPECT_EQ(*settled[0].value, 1);
    EXPECT_FALSE(settled[1].ok());
    EXPECT_EQ(describe(settled[1].error), "boom");
    EXPECT_EQ(*settled[2].value, 3);
}

TEST(ConsensusResult, JsonHasFixedShape) {
    ConsensusResult r;
    r.continent = "SA";
    r.country = "AR";
    r.city = "Buenos Aires";
    r.region = "South America";
    r.normalized_region = "south america";
    r.normalized_city = "buenos aires";
    r.asn = 61005;
    r.latitude = -34.6037;
    r.longitude = -58.3816;
    r.network = "InterBS S.R.L. (BAEHOST)";
    r.normalized_network = "interbs s.r.l. (baehost)";

    EXPECT_EQ(r.to_json(),
              "{\"continent\":\"SA\",\"country\":\"AR\",\"state\":null,\"city\":\"Buenos Aires\","
              "\"region\":\"South America\",\"normalizedRegion\":\"south america\","
              "\"normalizedCity\":\"buenos aires\",\"asn\":61005,\"latitude\":-34.6037,"
              "\"longitude\":-58.3816,\"network\":\"InterBS S.R.L. (BAEHOST)\","
              "\"normalizedNetwork\":\"interbs s.r.l. (baehost)\"}");
}

TEST(GeoError, PublicMessages) {
    EXPECT_STREQ(VpnDetected().what(), "vpn detected");
    EXPECT_STREQ(UnresolvableLocation("1.2.3.4").what(), "unresolvable geoip: 1.2.3.4");
    EXPECT_TRUE(VpnDetected().is_public());
    EXPECT_FALSE(InternalConsistency().is_public());
    EXPECT_FALSE(SourceFailure("x").is_public());
    EXPECT_STREQ(error_kind_name(ErrorKind::UnresolvableLocation), "unresolvable_location");
    EXPECT_STREQ(error_kind_name(InternalConsistency().kind()), "internal_consistency");
}

TEST(DiagLogger, CountsNoticedErrorsPerScope) {
    DiagLogger diag("/dev/null", LogLevel::Error);
    diag.notice_error("cache", "a");
    diag.notice_error("cache", "b");
    diag.notice_error("geoip", "c");
    diag.warn("cache", "not counted");
    EXPECT_EQ(diag.error_count("cache"), 2);
    EXPECT_EQ(diag.error_count("geoip"), 1);
    EXPECT_EQ(diag.error_count("allowlist"), 0);
    EXPECT_EQ(parse_log_level("warn"), std::optional<LogLevel>(LogLevel::Warn));
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

} // namespace
