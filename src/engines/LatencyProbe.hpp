#ifndef LATENCY_PROBE_H
#define LATENCY_PROBE_H

#include <chrono>
#include <string>
#include <vector>

#include "measurement_engine.h"

/**
 * Round-trip sampling over one keep-alive connection: N sequential HEAD
 * requests, a short pause between them. The first samples carry the TCP/TLS
 * handshake and are discarded before the statistics are taken.
 */
class LatencyProbe {
public:
    struct Config {
        int samples = 15;
        std::chrono::milliseconds interval{50};
        std::chrono::milliseconds connectTimeout{3000};
        std::chrono::milliseconds requestTimeout{2000};
    };

    static constexpr size_t kWarmupSamples = 2;
    static constexpr double kTrimFraction = 0.10;

    explicit LatencyProbe(Config config);

    // Zero ping and jitter when no request succeeded
    LatencyResult measure(ResourceLifecycle& lifecycle, const std::string& url);

    // Warm-up drop, 10% trim on both ends, mean and mean absolute successive
    // difference. Samples are in milliseconds, in the order they were taken.
    static LatencyResult summarize(std::vector<double> samples);

private:
    Config config_;
};

#endif // LATENCY_PROBE_H
