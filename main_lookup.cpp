/**
 * # resolve one address through all five providers
 * ./bin/geoip_lookup 131.255.7.26
 *
 * Examples with options:
 *   IP2LOCATION_API_KEY=... IPINFO_TOKEN=... ./bin/geoip_lookup 8.8.8.8 --timeout-ms=3000 --log=diag.txt
 *   ./bin/geoip_lookup 5.134.119.43 --allowlist=config/allowlist-ips.txt --log-level=debug
 */

#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "allowlist.hpp"
#include "cache.hpp"
#include "config.hpp"
#include "diag_logger.hpp"
#include "geo_error.hpp"
#include "geo_resolver.hpp"
#include "geo_sources.hpp"
#include "http_client.hpp"

using namespace std;
using namespace geoip;

static void print_usage(const char *argv0) {
    cerr << "Usage:\n"
         << "  " << argv0 << " <address> [--ttl=SECONDS] [--timeout-ms=N] [--allowlist=PATH]"
         << " [--log=PATH] [--log-level=debug|info|warn|error]\n"
         << "\nEnvironment:\n"
         << "  IP2LOCATION_API_KEY, IPINFO_TOKEN, MAXMIND_ACCOUNT_ID, MAXMIND_LICENSE_KEY\n"
         << "  GEOIP_CACHE_TTL, GEOIP_SOURCE_TIMEOUT_MS, GEOIP_ALLOWLIST, GEOIP_LOG, GEOIP_LOG_LEVEL\n";
}

int main(int argc, char *argv[]) {
    ios::sync_with_stdio(false);

    if (argc < 2) { print_usage(argv[0]); return 1; }

    Config cfg;
    vector<string> pos;
    try {
        cfg.apply_env();
        pos = cfg.apply_args(vector<string>(argv + 1, argv + argc));
    } catch (const exception &e) {
        cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }
    if (pos.size() != 1) { print_usage(argv[0]); return 1; }
    const string addr = pos[0];

    DiagLogger diag(cfg.log_path, cfg.log_level);
    if (!diag.ok()) {
        cerr << "Warning: couldn't open log file: " << cfg.log_path << "\n";
    }

    try {
        // Process-wide tables are built before the first lookup and never touched again.
        auto allowlist = make_shared<const Allowlist>(Allowlist::load(cfg.allowlist_path, &diag));
        (void)RegionResolver::instance();

        auto http = make_shared<const HttpClient>(cfg.source_timeout_ms);
        MemoryCache cache;
        GeoResolver resolver(make_sources(cfg, http), cache, allowlist, cfg.cache_ttl_seconds, &diag);

        ConsensusResult result = resolver.lookup(addr);
        cout << result.to_json() << '\n';
        return 0;
    } catch (const GeoError &e) {
        cerr << "Error: " << e.what() << '\n';
        return 1;
    } catch (const exception &e) {
        diag.error("main", e.what());
        cerr << "Error: " << e.what() << '\n';
        return 1;
    }
}
