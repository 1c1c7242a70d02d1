#include "BestServerDiscovery.hpp"
#include "DiscoveryCascade.hpp"
#include "gauge_logger.h"
#include "url.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <stdexcept>

namespace {

bool sameCountry(const std::string& a, const std::string& b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

std::string textField(const json& entry, const char* key) {
    if (!entry.contains(key) || entry[key].is_null()) {
        return "";
    }
    const json& value = entry[key];
    return value.is_string() ? value.get<std::string>() : value.dump();
}

} // namespace

ProbeLatencySampler::ProbeLatencySampler(LatencyProbe::Config config)
    : config_(config) {
}

LatencyResult ProbeLatencySampler::sample(ResourceLifecycle& lifecycle, const std::string& url) {
    LatencyProbe probe(config_);
    return probe.measure(lifecycle, url);
}

BestServerDiscovery::BestServerDiscovery(std::vector<ServerEntry> servers, Options options,
                                         std::shared_ptr<LatencySampler> sampler)
    : servers_(std::move(servers)), options_(std::move(options)), sampler_(std::move(sampler)) {
}

std::vector<ServerEntry> BestServerDiscovery::parseServerList(const json& list) {
    std::vector<ServerEntry> servers;
    if (!list.is_array()) {
        return servers;
    }
    for (const json& entry : list) {
        if (!entry.is_object()) {
            continue;
        }
        ServerEntry server;
        server.id = textField(entry, "id");
        server.name = textField(entry, "name");
        server.sponsor = textField(entry, "sponsor");
        server.country = textField(entry, "country");
        server.url = textField(entry, "url");
        try {
            Url::parse(server.url);
        } catch (const std::invalid_argument& e) {
            GAUGE_LOG("discovery", std::string("Skipping server list entry: ") + e.what());
            continue;
        }
        servers.push_back(std::move(server));
    }
    return servers;
}

std::vector<ServerEntry> BestServerDiscovery::selectCandidates(const std::vector<ServerEntry>& servers,
                                                               const Options& options) {
    std::vector<ServerEntry> local;
    if (!options.preferredCountry.empty()) {
        for (const ServerEntry& server : servers) {
            if (sameCountry(server.country, options.preferredCountry)) {
                local.push_back(server);
            }
        }
        if (local.size() >= kMinLocalServers) {
            return local;
        }
    }

    // Too few local servers: keep them first, then fill up in directory order
    std::vector<ServerEntry> candidates = local;
    std::set<std::string> seen;
    for (const ServerEntry& server : local) {
        seen.insert(server.url);
    }
    for (const ServerEntry& server : servers) {
        if (candidates.size() >= options.maxCandidates) {
            break;
        }
        if (seen.insert(server.url).second) {
            candidates.push_back(server);
        }
    }
    return candidates;
}

std::string BestServerDiscovery::siblingUrl(const std::string& url, const std::string& leaf) {
    Url parsed = Url::parse(url);
    std::string path = parsed.target.substr(0, parsed.target.find('?'));
    const size_t slash = path.rfind('/');
    path = (slash == std::string::npos ? std::string("/") : path.substr(0, slash + 1)) + leaf;
    parsed.target = path;
    return parsed.toString();
}

std::optional<json> BestServerDiscovery::run(ResourceLifecycle& lifecycle) {
    const std::vector<ServerEntry> candidates = selectCandidates(servers_, options_);
    GAUGE_LOG("discovery", "Ranking " + std::to_string(candidates.size()) + " of " +
              std::to_string(servers_.size()) + " servers by latency");

    std::optional<size_t> best;
    double bestPing = 0.0;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (lifecycle.shouldStop()) {
            return std::nullopt;
        }

        const ServerEntry& server = candidates[i];
        ++servers_measured_;
        LatencyResult latency = sampler_->sample(lifecycle, siblingUrl(server.url, "latency.txt"));
        if (latency.pingMs <= 0.0) {
            GAUGE_LOG("discovery", "No answer from " + server.name + " (" + server.url + ")");
            continue;
        }

        GAUGE_LOG("discovery", server.name + " answered in " + std::to_string(latency.pingMs) + " ms");
        if (!best || latency.pingMs < bestPing) {
            best = i;
            bestPing = latency.pingMs;
        }
    }

    if (!best || lifecycle.shouldStop()) {
        return std::nullopt;
    }

    const ServerEntry& server = candidates[*best];
    Url parsed = Url::parse(server.url);

    json target;
    target["testUrl"] = server.url;
    target["host"] = parsed.host;
    target["downloadBase"] = siblingUrl(server.url, "");
    target["latencyUrl"] = siblingUrl(server.url, "latency.txt");
    target["serverId"] = server.id;
    target["serverName"] = server.name;
    target["sponsor"] = server.sponsor;
    target["country"] = server.country;
    target["classification"] = DiscoveryCascade::classify(bestPing);
    target["candidateIndex"] = *best;
    target["rttMs"] = bestPing;

    GAUGE_LOG_INFO("discovery", "Selected " + server.name + " (" + server.sponsor + ") at " +
                   std::to_string(bestPing) + " ms");
    return target;
}
