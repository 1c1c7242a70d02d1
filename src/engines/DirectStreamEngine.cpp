#include "DirectStreamEngine.hpp"
#include "UploadWorkers.hpp"
#include "WorkerGroup.hpp"
#include "gauge_logger.h"
#include "http_client.h"

DirectStreamEngine::DirectStreamEngine(EngineSettings settings)
    : settings_(std::move(settings)) {
}

std::chrono::milliseconds DirectStreamEngine::phaseDuration() const {
    return std::chrono::seconds(settings_.phase_duration_sec);
}

void DirectStreamEngine::runDownload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                                     const json& metadata) {
    (void)metadata;
    const auto deadline = std::chrono::steady_clock::now() + phaseDuration();

    WorkerGroup group("direct-stream");
    for (int id = 0; id < settings_.min_workers; ++id) {
        group.add([this, &lifecycle, &onBytes, id, deadline]() {
            streamWorker(lifecycle, onBytes, id, deadline);
        });
    }
    group.joinAll();
}

void DirectStreamEngine::streamWorker(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                                      int id, std::chrono::steady_clock::time_point deadline) {
    HttpClient::Options options;
    options.connectTimeout = std::chrono::milliseconds(settings_.connect_timeout_ms);
    // A full object transfer is bounded by the phase, not the request timeout
    options.requestTimeout = phaseDuration();

    auto client = std::make_shared<HttpClient>(&lifecycle.timers(), options);
    if (!lifecycle.registerClient(client)) {
        return;
    }

    if (settings_.worker_stagger_ms > 0 &&
        lifecycle.waitForStop(std::chrono::milliseconds(settings_.worker_stagger_ms * id))) {
        lifecycle.releaseClient(client);
        return;
    }

    HttpRequest request;
    request.url = Url::parse(settings_.download_url);
    request.headers = {{"Cache-Control", "no-store"}};

    HttpClient::BodyCallback onBody = [&onBytes](const char*, size_t n) { onBytes(n); };

    while (!lifecycle.shouldStop() && std::chrono::steady_clock::now() < deadline) {
        try {
            HttpResponse response = client->execute(request, onBody);
            if (response.statusCode != 200) {
                GAUGE_LOG("direct-stream", "Worker " + std::to_string(id) + " got status " +
                          std::to_string(response.statusCode));
                lifecycle.waitForStop(std::chrono::milliseconds(100));
            }
        } catch (const std::exception& e) {
            if (lifecycle.shouldStop()) {
                break;
            }
            GAUGE_LOG("direct-stream", "Worker " + std::to_string(id) + ": " + e.what());
            lifecycle.waitForStop(std::chrono::milliseconds(100));
        }
    }

    client->forceClose();
    lifecycle.releaseClient(client);
}

void DirectStreamEngine::runUpload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                                   const json& metadata) {
    (void)metadata;
    {
        std::lock_guard<std::mutex> lock(tier_mutex_);
        upload_tier_.clear();
    }

    TieredUploader uploader(lifecycle, onBytes, std::chrono::milliseconds(settings_.upload_probation_ms));
    uploader.setTierChangeCallback([this](const std::string& tier) {
        std::lock_guard<std::mutex> lock(tier_mutex_);
        upload_tier_ = tier;
    });
    uploader.addTier(makeStreamTier("direct", settings_.upload_urls, settings_.upload_workers,
                                    settings_.upload_payload_bytes, settings_.upload_slice_bytes,
                                    settings_));
    uploader.run();
}

json DirectStreamEngine::liveMetadata() const {
    json meta = json::object();
    std::lock_guard<std::mutex> lock(tier_mutex_);
    if (!upload_tier_.empty()) {
        meta["uploadTier"] = upload_tier_;
    }
    return meta;
}

TieredUploader::Tier DirectStreamEngine::makeStreamTier(const std::string& name,
                                                        std::vector<std::string> urls, int workers,
                                                        size_t payloadBytes, size_t sliceBytes,
                                                        const EngineSettings& timeouts) {
    auto config = std::make_shared<PostLoopConfig>();
    config->urls = std::move(urls);
    config->payload = makeUploadPayload(payloadBytes);
    config->sliceBytes = sliceBytes;
    config->connectTimeout = std::chrono::milliseconds(timeouts.connect_timeout_ms);
    config->requestTimeout = std::chrono::milliseconds(timeouts.request_timeout_ms);

    TieredUploader::Tier tier;
    tier.name = name;
    tier.workers = workers;
    tier.worker = [config](TieredUploader::TierContext& context, int id) {
        runPostLoop(context, *config, id);
    };
    return tier;
}
