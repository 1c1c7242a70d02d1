#ifndef BEST_SERVER_DISCOVERY_H
#define BEST_SERVER_DISCOVERY_H

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "LatencyProbe.hpp"
#include "resource_lifecycle.h"

using json = nlohmann::json;

// One entry of a speed test server directory
struct ServerEntry {
    std::string id;
    std::string name;
    std::string sponsor;
    std::string country;
    std::string url; // upload endpoint; downloads and latency.txt live beside it
};

class LatencySampler {
public:
    virtual ~LatencySampler() = default;
    virtual LatencyResult sample(ResourceLifecycle& lifecycle, const std::string& url) = 0;
};

// A short LatencyProbe run per candidate
class ProbeLatencySampler : public LatencySampler {
public:
    explicit ProbeLatencySampler(LatencyProbe::Config config);

    LatencyResult sample(ResourceLifecycle& lifecycle, const std::string& url) override;

private:
    LatencyProbe::Config config_;
};

/**
 * Latency-ranked server selection. Unlike DiscoveryCascade every candidate is
 * measured; the one with the lowest ping wins and ties go to the earlier
 * entry. Candidates that answered no sample are skipped.
 */
class BestServerDiscovery {
public:
    struct Options {
        // Servers in this country are preferred when there are at least
        // kMinLocalServers of them
        std::string preferredCountry;
        size_t maxCandidates = 10;
    };

    static constexpr size_t kMinLocalServers = 3;

    BestServerDiscovery(std::vector<ServerEntry> servers, Options options,
                        std::shared_ptr<LatencySampler> sampler);

    // Target descriptor of the fastest candidate, or nullopt
    std::optional<json> run(ResourceLifecycle& lifecycle);

    // Entries without a usable http(s) url are dropped; ids may be numbers or strings
    static std::vector<ServerEntry> parseServerList(const json& list);

    static std::vector<ServerEntry> selectCandidates(const std::vector<ServerEntry>& servers,
                                                     const Options& options);

    // `url` with its last path segment (and query) replaced by `leaf`
    static std::string siblingUrl(const std::string& url, const std::string& leaf);

    size_t serversMeasured() const { return servers_measured_; }

private:
    std::vector<ServerEntry> servers_;
    Options options_;
    std::shared_ptr<LatencySampler> sampler_;
    size_t servers_measured_ = 0;
};

#endif // BEST_SERVER_DISCOVERY_H
