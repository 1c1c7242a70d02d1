#include "EdgeCacheEngine.hpp"
#include "DirectStreamEngine.hpp"
#include "LatencyProbe.hpp"
#include "RangeChunkDownloader.hpp"
#include "TieredUploader.hpp"
#include "UploadWorkers.hpp"
#include "gauge_logger.h"

namespace {
constexpr int kFallbackWorkers = 4;
constexpr size_t kFallbackPayloadBytes = 512 * 1024;
constexpr size_t kEdgeChunkBytes = 512 * 1024;
}

EdgeCacheEngine::EdgeCacheEngine(EngineSettings settings, std::string fallbackUploadUrl)
    : settings_(std::move(settings)), fallback_upload_url_(std::move(fallbackUploadUrl)) {
}

std::chrono::milliseconds EdgeCacheEngine::phaseDuration() const {
    return std::chrono::seconds(settings_.phase_duration_sec);
}

std::optional<json> EdgeCacheEngine::discover(ResourceLifecycle& lifecycle) {
    std::shared_ptr<TargetProber> prober = prober_;
    if (!prober) {
        HttpTargetProber::Options options;
        options.useGet = settings_.probe_with_get;
        options.minBytes = settings_.min_probe_bytes;
        options.connectTimeout = std::chrono::milliseconds(settings_.probe_timeout_ms);
        options.requestTimeout = std::chrono::milliseconds(settings_.probe_timeout_ms);
        prober = std::make_shared<HttpTargetProber>(options);
    }

    DiscoveryCascade::Criteria criteria;
    criteria.requireRanges = settings_.require_ranges;
    criteria.minBytes = settings_.min_probe_bytes;

    DiscoveryCascade cascade(settings_.candidate_urls, criteria, prober);
    std::optional<json> target = cascade.run(lifecycle);
    if (target) {
        test_url_ = (*target)["testUrl"].get<std::string>();
    }
    return target;
}

LatencyResult EdgeCacheEngine::measureLatency(ResourceLifecycle& lifecycle) {
    if (test_url_.empty()) {
        return LatencyResult{};
    }

    LatencyProbe::Config config;
    config.samples = settings_.latency_samples;
    config.interval = std::chrono::milliseconds(settings_.latency_interval_ms);
    config.connectTimeout = std::chrono::milliseconds(settings_.connect_timeout_ms);

    LatencyProbe probe(config);
    return probe.measure(lifecycle, test_url_);
}

void EdgeCacheEngine::runDownload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                                  const json& metadata) {
    RangeChunkDownloader::Config config;
    config.url = metadata.value("testUrl", test_url_);
    config.contentLength = metadata.value("contentLength", static_cast<std::int64_t>(-1));
    config.duration = phaseDuration();
    config.connectTimeout = std::chrono::milliseconds(settings_.connect_timeout_ms);
    config.requestTimeout = std::chrono::milliseconds(settings_.request_timeout_ms);
    config.workerStagger = std::chrono::milliseconds(settings_.worker_stagger_ms);
    config.rampInterval = std::chrono::milliseconds(settings_.ramp_interval_ms);
    config.ramp.initialWorkers = settings_.min_workers;
    config.ramp.maxWorkers = settings_.max_workers;
    config.ramp.step = settings_.ramp_step;
    config.chunks.minBytes = settings_.chunk_min_bytes;
    config.chunks.maxBytes = settings_.chunk_max_bytes;
    config.chunks.fastThreshold = std::chrono::milliseconds(settings_.fast_chunk_ms);
    config.chunks.slowThreshold = std::chrono::milliseconds(settings_.slow_chunk_ms);

    GAUGE_LOG_INFO("edge-cache", "Downloading ranges of " + config.url);
    RangeChunkDownloader downloader(config);
    downloader.run(lifecycle, onBytes);
}

void EdgeCacheEngine::runUpload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                                const json& metadata) {
    {
        std::lock_guard<std::mutex> lock(tier_mutex_);
        upload_tier_.clear();
    }

    TieredUploader uploader(lifecycle, onBytes, std::chrono::milliseconds(settings_.upload_probation_ms));
    uploader.setTierChangeCallback([this](const std::string& tier) {
        std::lock_guard<std::mutex> lock(tier_mutex_);
        upload_tier_ = tier;
    });

    if (!settings_.upload_urls.empty()) {
        uploader.addTier(DirectStreamEngine::makeStreamTier(
            "primary-post", settings_.upload_urls, settings_.upload_workers,
            settings_.upload_payload_bytes, settings_.upload_slice_bytes, settings_));
    }

    const std::string edgeIp = metadata.value("edgeIp", std::string());
    if (!edgeIp.empty()) {
        auto edge = std::make_shared<EdgeSocketConfig>();
        edge->edgeIp = edgeIp;
        edge->host = metadata.value("host", std::string());
        edge->chunk = makeUploadPayload(kEdgeChunkBytes);
        edge->connectTimeout = std::chrono::milliseconds(settings_.connect_timeout_ms);

        TieredUploader::Tier tier;
        tier.name = "edge-socket";
        tier.workers = 1;
        tier.worker = [edge](TieredUploader::TierContext& context, int id) {
            runEdgeSocketWriter(context, *edge, id);
        };
        uploader.addTier(tier);
    }

    uploader.addTier(DirectStreamEngine::makeStreamTier(
        "fallback", {fallback_upload_url_}, kFallbackWorkers, kFallbackPayloadBytes,
        kFallbackPayloadBytes / 8, settings_));

    uploader.run();
}

json EdgeCacheEngine::liveMetadata() const {
    json meta = json::object();
    std::lock_guard<std::mutex> lock(tier_mutex_);
    if (!upload_tier_.empty()) {
        meta["uploadTier"] = upload_tier_;
    }
    return meta;
}
