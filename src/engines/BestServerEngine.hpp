#ifndef BEST_SERVER_ENGINE_H
#define BEST_SERVER_ENGINE_H

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "BestServerDiscovery.hpp"
#include "measurement_config.h"
#include "measurement_engine.h"

/**
 * Server-directory test. Discovery reads a JSON list of speed test servers
 * and keeps the one with the lowest ping; latency is sampled against its
 * latency.txt. Downloads fetch the server's test images with a cache-busting
 * query, and every ramp interval adds workers that fetch the next larger
 * image. Upload POSTs to the server itself, with the shared fallback tier
 * behind it.
 */
class BestServerEngine : public MeasurementEngine {
public:
    BestServerEngine(EngineSettings settings, std::string fallbackUploadUrl);

    std::string engineName() const override { return "best-server"; }
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

    // Replaces the per-candidate latency sampler (tests)
    void setSampler(std::shared_ptr<LatencySampler> sampler) { sampler_ = std::move(sampler); }

    static std::string downloadUrl(const std::string& base, const std::string& file,
                                   std::uint64_t nonce);

    static constexpr int kRankingSamples = 4;

private:
    std::vector<ServerEntry> fetchServerList(ResourceLifecycle& lifecycle);
    void downloadWorker(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                        const std::string& base, const std::string& file, int id,
                        std::chrono::steady_clock::time_point deadline);

    EngineSettings settings_;
    std::string fallback_upload_url_;
    std::shared_ptr<LatencySampler> sampler_;

    std::string latency_url_;
    std::string download_base_;
    std::atomic<std::uint64_t> nonce_{0};

    mutable std::mutex status_mutex_;
    std::string upload_tier_;
    std::string download_file_;
};

#endif // BEST_SERVER_ENGINE_H
