#include "DiscoveryCascade.hpp"
#include "gauge_logger.h"
#include "http_client.h"
#include "measurement_errors.h"

#include <algorithm>
#include <cctype>

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// First edge-identifying header the response carries
std::string servedByHeader(const HttpResponse& response) {
    static const char* kHeaders[] = {"X-Served-By", "X-Cache", "Server", "Via", "X-Akamai-Request-ID"};
    for (const char* name : kHeaders) {
        std::string value = response.header(name);
        if (!value.empty()) {
            return value;
        }
    }
    return "";
}

} // namespace

HttpTargetProber::HttpTargetProber(Options options)
    : options_(options) {
}

ProbeOutcome HttpTargetProber::probe(ResourceLifecycle& lifecycle, const std::string& url) {
    ProbeOutcome outcome;

    HttpClient::Options clientOptions;
    clientOptions.connectTimeout = options_.connectTimeout;
    clientOptions.requestTimeout = options_.requestTimeout;

    auto client = std::make_shared<HttpClient>(&lifecycle.timers(), clientOptions);
    if (!lifecycle.registerClient(client)) {
        outcome.error = "stopped";
        return outcome;
    }

    try {
        HttpRequest request;
        request.method = options_.useGet ? "GET" : "HEAD";
        request.url = Url::parse(url);
        request.headers.push_back({"Cache-Control", "no-cache"});

        if (options_.useGet && options_.minBytes > 0) {
            // Enough evidence once the body passed the minimum size
            request.readLimit = options_.minBytes + 1;
        }

        auto started = std::chrono::steady_clock::now();
        HttpResponse response = client->execute(request);
        auto elapsed = std::chrono::steady_clock::now() - started;
        outcome.rttMs = std::chrono::duration<double, std::milli>(elapsed).count();

        outcome.reachable = true;
        outcome.statusCode = response.statusCode;
        outcome.finalUrl = response.finalUrl.toString();
        outcome.edgeIp = response.remoteAddress;
        outcome.contentType = response.header("Content-Type");
        outcome.contentLength = response.head.contentLength;
        outcome.acceptsRanges = toLower(response.header("Accept-Ranges")).find("bytes") != std::string::npos
                                || response.statusCode == 206;
        outcome.bytesRead = options_.useGet ? response.bodyBytes : 0;
        outcome.servedBy = servedByHeader(response);
    } catch (const std::exception& e) {
        outcome.error = e.what();
    }

    client->forceClose();
    lifecycle.releaseClient(client);
    return outcome;
}

DiscoveryCascade::DiscoveryCascade(std::vector<std::string> candidates, Criteria criteria,
                                   std::shared_ptr<TargetProber> prober)
    : candidates_(std::move(candidates)), criteria_(criteria), prober_(std::move(prober)) {
    if (!prober_) {
        throw std::invalid_argument("DiscoveryCascade needs a prober");
    }
}

std::optional<json> DiscoveryCascade::run(ResourceLifecycle& lifecycle) {
    for (size_t i = 0; i < candidates_.size(); ++i) {
        if (lifecycle.shouldStop()) {
            return std::nullopt;
        }

        const std::string& candidate = candidates_[i];
        ++probes_issued_;
        ProbeOutcome outcome = prober_->probe(lifecycle, candidate);

        std::string rejection = validate(outcome, criteria_);
        if (!rejection.empty()) {
            GAUGE_LOG("discovery", "Rejected " + candidate + ": " + rejection);
            continue;
        }

        std::string testUrl = outcome.finalUrl.empty() ? candidate : outcome.finalUrl;
        Url parsed = Url::parse(testUrl);

        json target;
        target["testUrl"] = testUrl;
        target["host"] = parsed.host;
        target["path"] = parsed.target;
        target["edgeIp"] = outcome.edgeIp;
        target["contentLength"] = outcome.contentLength;
        target["acceptsRanges"] = outcome.acceptsRanges;
        target["classification"] = classify(outcome.rttMs);
        target["candidateIndex"] = i;
        target["rttMs"] = outcome.rttMs;
        if (!outcome.servedBy.empty()) {
            target["servedBy"] = outcome.servedBy;
        }

        GAUGE_LOG_INFO("discovery", "Selected " + testUrl + " at " +
                       (outcome.edgeIp.empty() ? std::string("?") : outcome.edgeIp) +
                       " (" + target["classification"].get<std::string>() + ")");
        return target;
    }

    return std::nullopt;
}

std::string DiscoveryCascade::validate(const ProbeOutcome& outcome, const Criteria& criteria) {
    if (!outcome.reachable) {
        return outcome.error.empty() ? "unreachable" : outcome.error;
    }

    if (outcome.statusCode != 200 && outcome.statusCode != 206) {
        return "status " + std::to_string(outcome.statusCode);
    }

    if (criteria.rejectHtml && toLower(outcome.contentType).find("text/html") != std::string::npos) {
        return "html page";
    }

    if (criteria.minBytes > 0) {
        std::uint64_t size = outcome.bytesRead;
        if (outcome.contentLength > 0) {
            size = std::max<std::uint64_t>(size, static_cast<std::uint64_t>(outcome.contentLength));
        }
        if (size < criteria.minBytes) {
            return "too small (" + std::to_string(size) + " bytes)";
        }
    }

    if (criteria.requireRanges && !outcome.acceptsRanges) {
        return "no byte ranges";
    }

    return "";
}

std::string DiscoveryCascade::classify(double rttMs) {
    if (rttMs < 20.0) {
        return "near-cache";
    }
    if (rttMs < 50.0) {
        return "edge-pop";
    }
    return "distant";
}
