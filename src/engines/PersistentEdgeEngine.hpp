#ifndef PERSISTENT_EDGE_ENGINE_H
#define PERSISTENT_EDGE_ENGINE_H

#include <memory>
#include <mutex>
#include <string>

#include "DiscoveryCascade.hpp"
#include "measurement_config.h"
#include "measurement_engine.h"

/**
 * Small-object edge test over long-lived sockets. Discovery GET-probes the
 * candidates for a reachable object of useful size; each download worker then
 * repeats GETs of that object on one keep-alive connection, reconnecting only
 * when the server drops it. Upload POSTs a fixed payload the same way, with
 * the shared fallback tier behind it. No latency phase.
 */
class PersistentEdgeEngine : public MeasurementEngine {
public:
    PersistentEdgeEngine(EngineSettings settings, std::string fallbackUploadUrl);

    std::string engineName() const override { return "persistent-edge"; }
    bool hasDiscovery() const override { return true; }
    std::chrono::milliseconds phaseDuration() const override;

    std::optional<json> discover(ResourceLifecycle& lifecycle) override;

    void runDownload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                     const json& metadata) override;
    void runUpload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                   const json& metadata) override;

    json liveMetadata() const override;

    void setProber(std::shared_ptr<TargetProber> prober) { prober_ = std::move(prober); }

    static std::string buildGetRequest(const Url& url, const std::string& userAgent);

private:
    void socketWorker(ResourceLifecycle& lifecycle, const ByteCallback& onBytes, const Url& url,
                      int id, std::chrono::steady_clock::time_point deadline);

    EngineSettings settings_;
    std::string fallback_upload_url_;
    std::shared_ptr<TargetProber> prober_;

    mutable std::mutex tier_mutex_;
    std::string upload_tier_;
};

#endif // PERSISTENT_EDGE_ENGINE_H
