#ifndef DISCOVERY_CASCADE_H
#define DISCOVERY_CASCADE_H

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "resource_lifecycle.h"

using json = nlohmann::json;

// What a single probe of one candidate URL observed
struct ProbeOutcome {
    bool reachable = false;
    int statusCode = 0;
    std::string finalUrl;
    std::string edgeIp;
    std::string contentType;
    std::int64_t contentLength = -1;
    bool acceptsRanges = false;
    std::uint64_t bytesRead = 0;
    double rttMs = 0.0;
    std::string servedBy;
    std::string error;
};

class TargetProber {
public:
    virtual ~TargetProber() = default;
    virtual ProbeOutcome probe(ResourceLifecycle& lifecycle, const std::string& url) = 0;
};

/**
 * Probes over HttpClient. HEAD mode reads headers only; GET mode reads up to
 * `minBytes` of the body so size can be checked on servers that do not send
 * Content-Length.
 */
class HttpTargetProber : public TargetProber {
public:
    struct Options {
        bool useGet = false;
        std::uint64_t minBytes = 0;
        std::chrono::milliseconds connectTimeout{4000};
        std::chrono::milliseconds requestTimeout{4000};
    };

    explicit HttpTargetProber(Options options);

    ProbeOutcome probe(ResourceLifecycle& lifecycle, const std::string& url) override;

private:
    Options options_;
};

/**
 * Ordered candidate search. Candidates are probed one after the other and the
 * first one that validates wins; later candidates are never contacted.
 */
class DiscoveryCascade {
public:
    struct Criteria {
        bool requireRanges = true;
        std::uint64_t minBytes = 0;
        bool rejectHtml = true;
    };

    DiscoveryCascade(std::vector<std::string> candidates, Criteria criteria,
                     std::shared_ptr<TargetProber> prober);

    // Target descriptor of the winning candidate, or nullopt
    std::optional<json> run(ResourceLifecycle& lifecycle);

    // Empty string when the outcome passes, the rejection reason otherwise
    static std::string validate(const ProbeOutcome& outcome, const Criteria& criteria);

    static std::string classify(double rttMs);

    size_t probesIssued() const { return probes_issued_; }

private:
    std::vector<std::string> candidates_;
    Criteria criteria_;
    std::shared_ptr<TargetProber> prober_;
    size_t probes_issued_ = 0;
};

#endif // DISCOVERY_CASCADE_H
