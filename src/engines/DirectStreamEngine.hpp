#ifndef DIRECT_STREAM_ENGINE_H
#define DIRECT_STREAM_ENGINE_H

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "TieredUploader.hpp"
#include "measurement_config.h"
#include "measurement_engine.h"

/**
 * Fixed-URL parallel streams: every worker GETs the whole download object in a
 * loop and POSTs the upload payload in a loop. No discovery, no latency phase.
 *
 * Its upload loop doubles as the guaranteed last tier of the other engines
 * (see makeStreamTier()).
 */
class DirectStreamEngine : public MeasurementEngine {
public:
    explicit DirectStreamEngine(EngineSettings settings);

    std::string engineName() const override { return "direct-stream"; }
    std::chrono::milliseconds phaseDuration() const override;

    void runDownload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                     const json& metadata) override;
    void runUpload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                   const json& metadata) override;

    json liveMetadata() const override;

    // POST loop tier against `urls`
    static TieredUploader::Tier makeStreamTier(const std::string& name, std::vector<std::string> urls,
                                               int workers, size_t payloadBytes, size_t sliceBytes,
                                               const EngineSettings& timeouts);

private:
    void streamWorker(ResourceLifecycle& lifecycle, const ByteCallback& onBytes, int id,
                      std::chrono::steady_clock::time_point deadline);

    EngineSettings settings_;

    mutable std::mutex tier_mutex_;
    std::string upload_tier_;
};

#endif // DIRECT_STREAM_ENGINE_H
