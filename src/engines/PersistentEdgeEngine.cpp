#include "PersistentEdgeEngine.hpp"
#include "DirectStreamEngine.hpp"
#include "TieredUploader.hpp"
#include "UploadWorkers.hpp"
#include "WorkerGroup.hpp"
#include "gauge_logger.h"
#include "persistent_transport.h"
#include "stream_socket.h"

namespace {
constexpr int kFallbackWorkers = 4;
constexpr size_t kFallbackPayloadBytes = 512 * 1024;
const char* const kUserAgent = "edgegauge/1.0";
}

PersistentEdgeEngine::PersistentEdgeEngine(EngineSettings settings, std::string fallbackUploadUrl)
    : settings_(std::move(settings)), fallback_upload_url_(std::move(fallbackUploadUrl)) {
}

std::chrono::milliseconds PersistentEdgeEngine::phaseDuration() const {
    return std::chrono::seconds(settings_.phase_duration_sec);
}

std::optional<json> PersistentEdgeEngine::discover(ResourceLifecycle& lifecycle) {
    std::shared_ptr<TargetProber> prober = prober_;
    if (!prober) {
        HttpTargetProber::Options options;
        options.useGet = true;
        options.minBytes = settings_.min_probe_bytes;
        options.connectTimeout = std::chrono::milliseconds(settings_.connect_timeout_ms);
        options.requestTimeout = std::chrono::milliseconds(settings_.probe_timeout_ms);
        prober = std::make_shared<HttpTargetProber>(options);
    }

    DiscoveryCascade::Criteria criteria;
    criteria.requireRanges = false;
    criteria.minBytes = settings_.min_probe_bytes;

    DiscoveryCascade cascade(settings_.candidate_urls, criteria, prober);
    return cascade.run(lifecycle);
}

std::string PersistentEdgeEngine::buildGetRequest(const Url& url, const std::string& userAgent) {
    std::string request;
    request += "GET " + url.target + " HTTP/1.1\r\n";
    request += "Host: " + url.authority() + "\r\n";
    request += "User-Agent: " + userAgent + "\r\n";
    request += "Accept: image/webp,image/*,*/*\r\n";
    request += "Accept-Encoding: identity\r\n";
    request += "Connection: keep-alive\r\n";
    request += "\r\n";
    return request;
}

void PersistentEdgeEngine::runDownload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                                       const json& metadata) {
    const Url url = Url::parse(metadata.at("testUrl").get<std::string>());
    const auto deadline = std::chrono::steady_clock::now() + phaseDuration();

    WorkerGroup group("persistent-edge");
    for (int id = 0; id < settings_.min_workers; ++id) {
        group.add([this, &lifecycle, &onBytes, url, id, deadline]() {
            socketWorker(lifecycle, onBytes, url, id, deadline);
        });
    }
    group.joinAll();
}

void PersistentEdgeEngine::socketWorker(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                                        const Url& url, int id,
                                        std::chrono::steady_clock::time_point deadline) {
    if (lifecycle.waitForStop(std::chrono::milliseconds(settings_.worker_stagger_ms * id))) {
        return;
    }

    const std::string request = buildGetRequest(url, kUserAgent);
    std::uint64_t requests = 0;

    while (!lifecycle.shouldStop() && std::chrono::steady_clock::now() < deadline) {
        auto socket = StreamSocket::create(url, std::chrono::milliseconds(settings_.connect_timeout_ms));
        if (!lifecycle.registerSocket(socket)) {
            break;
        }

        try {
            socket->connect(url.host, url.port);
            PersistentTransport transport(socket);
            transport.setWireByteCallback(onBytes);
            GAUGE_LOG("persistent-edge", "W" + std::to_string(id) + " connected to " +
                      socket->remoteAddress());

            while (!lifecycle.shouldStop() && std::chrono::steady_clock::now() < deadline) {
                ParsedResponse response = transport.sendRequest(request);
                if (!response.ok()) {
                    break;
                }
                ++requests;
                if (response.statusCode != 200) {
                    GAUGE_LOG("persistent-edge", "W" + std::to_string(id) + " HTTP " +
                              std::to_string(response.statusCode));
                    break;
                }
            }
        } catch (const std::exception& e) {
            if (!lifecycle.shouldStop()) {
                GAUGE_LOG("persistent-edge", "W" + std::to_string(id) + " error: " + e.what());
                lifecycle.waitForStop(std::chrono::milliseconds(500));
            }
        }

        socket->forceClose();
        lifecycle.releaseSocket(socket);
    }

    GAUGE_LOG("persistent-edge", "W" + std::to_string(id) + " finished after " +
              std::to_string(requests) + " requests");
}

void PersistentEdgeEngine::runUpload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
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

    if (!settings_.upload_urls.empty()) {
        auto post = std::make_shared<PersistentPostConfig>();
        post->url = settings_.upload_urls.front();
        post->payload = makeUploadPayload(settings_.upload_payload_bytes);
        post->sliceBytes = settings_.upload_slice_bytes;
        post->connectTimeout = std::chrono::milliseconds(settings_.connect_timeout_ms);
        post->userAgent = kUserAgent;

        const int stagger = settings_.worker_stagger_ms;
        TieredUploader::Tier tier;
        tier.name = "persistent-post";
        tier.workers = settings_.upload_workers;
        tier.worker = [post, stagger](TieredUploader::TierContext& context, int id) {
            if (context.waitForStop(std::chrono::milliseconds(stagger * id))) {
                return;
            }
            runPersistentPost(context, *post, id);
        };
        uploader.addTier(tier);
    }

    uploader.addTier(DirectStreamEngine::makeStreamTier(
        "fallback", {fallback_upload_url_}, kFallbackWorkers, kFallbackPayloadBytes,
        kFallbackPayloadBytes / 8, settings_));

    uploader.run();
}

json PersistentEdgeEngine::liveMetadata() const {
    json meta = json::object();
    std::lock_guard<std::mutex> lock(tier_mutex_);
    if (!upload_tier_.empty()) {
        meta["uploadTier"] = upload_tier_;
    }
    return meta;
}
