#ifndef EDGE_CACHE_ENGINE_H
#define EDGE_CACHE_ENGINE_H

#include <memory>
#include <mutex>
#include <string>

#include "DiscoveryCascade.hpp"
#include "measurement_config.h"
#include "measurement_engine.h"

/**
 * Large-object CDN test. Discovery picks the first candidate object that is
 * served with byte ranges, latency is sampled against it, the download phase
 * runs adaptive range-chunked workers, and the upload phase walks the tiers
 *   primary-post -> edge-socket -> fallback
 */
class EdgeCacheEngine : public MeasurementEngine {
public:
    EdgeCacheEngine(EngineSettings settings, std::string fallbackUploadUrl);

    std::string engineName() const override { return "edge-cache"; }
    bool hasDiscovery() const override { return true; }
    bool hasLatencyTest() const override { return true; }
    std::chrono::milliseconds phaseDuration() const override;

    std::optional<json> discover(ResourceLifecycle& lifecycle) override;
    LatencyResult measureLatency(ResourceLifecycle& lifecycle) override;

    void runDownload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                     const json& metadata) override;
    void runUpload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                   const json& metadata) override;

    json liveMetadata() const override;

    // Replaces the HTTP prober (tests)
    void setProber(std::shared_ptr<TargetProber> prober) { prober_ = std::move(prober); }

private:
    EngineSettings settings_;
    std::string fallback_upload_url_;
    std::shared_ptr<TargetProber> prober_;

    std::string test_url_;

    mutable std::mutex tier_mutex_;
    std::string upload_tier_;
};

#endif // EDGE_CACHE_ENGINE_H
