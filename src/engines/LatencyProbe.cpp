#include "LatencyProbe.hpp"
#include "gauge_logger.h"
#include "http_client.h"

#include <algorithm>
#include <cmath>
#include <numeric>

LatencyProbe::LatencyProbe(Config config)
    : config_(config) {
}

LatencyResult LatencyProbe::measure(ResourceLifecycle& lifecycle, const std::string& url) {
    HttpClient::Options options;
    options.connectTimeout = config_.connectTimeout;
    options.requestTimeout = config_.requestTimeout;

    auto client = std::make_shared<HttpClient>(&lifecycle.timers(), options);
    if (!lifecycle.registerClient(client)) {
        return LatencyResult{};
    }

    Url target = Url::parse(url);
    std::vector<double> samples;

    for (int i = 0; i < config_.samples; ++i) {
        if (lifecycle.shouldStop()) {
            break;
        }
        try {
            auto started = std::chrono::steady_clock::now();
            client->head(target);
            auto elapsed = std::chrono::steady_clock::now() - started;
            samples.push_back(std::chrono::duration<double, std::milli>(elapsed).count());
        } catch (const std::exception& e) {
            GAUGE_LOG("latency", std::string("Sample failed: ") + e.what());
        }
        if (lifecycle.waitForStop(config_.interval)) {
            break;
        }
    }

    client->forceClose();
    lifecycle.releaseClient(client);

    LatencyResult result = summarize(samples);
    GAUGE_LOG_INFO("latency", "Ping " + std::to_string(result.pingMs) + " ms, jitter " +
                   std::to_string(result.jitterMs) + " ms over " +
                   std::to_string(samples.size()) + " samples");
    return result;
}

LatencyResult LatencyProbe::summarize(std::vector<double> samples) {
    LatencyResult result;
    if (samples.empty()) {
        return result;
    }

    if (samples.size() > kWarmupSamples) {
        samples.erase(samples.begin(), samples.begin() + kWarmupSamples);
    }

    // Trim the extremes by value, then keep the survivors in the order taken
    const size_t trim = static_cast<size_t>(std::floor(samples.size() * kTrimFraction));
    std::vector<double> kept = samples;
    if (trim > 0) {
        std::vector<double> sorted = samples;
        std::sort(sorted.begin(), sorted.end());
        const double low = sorted[trim];
        const double high = sorted[sorted.size() - 1 - trim];

        size_t dropLow = 0;
        size_t dropHigh = 0;
        for (double v : sorted) {
            if (v < low) ++dropLow;
            if (v > high) ++dropHigh;
        }
        // Ties at the cut values: drop just enough of them to remove `trim` per end
        size_t tieLow = trim - dropLow;
        size_t tieHigh = trim - dropHigh;

        kept.clear();
        for (double v : samples) {
            if (v < low || v > high) {
                continue;
            }
            if (v == low && tieLow > 0) {
                --tieLow;
                continue;
            }
            if (v == high && tieHigh > 0) {
                --tieHigh;
                continue;
            }
            kept.push_back(v);
        }
    }

    if (kept.empty()) {
        result.pingMs = std::accumulate(samples.begin(), samples.end(), 0.0) / samples.size();
        return result;
    }

    result.pingMs = std::accumulate(kept.begin(), kept.end(), 0.0) / kept.size();
    if (kept.size() > 1) {
        double sum = 0.0;
        for (size_t i = 1; i < kept.size(); ++i) {
            sum += std::fabs(kept[i] - kept[i - 1]);
        }
        result.jitterMs = sum / (kept.size() - 1);
    }
    return result;
}
