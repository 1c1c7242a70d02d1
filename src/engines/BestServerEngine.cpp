#include "BestServerEngine.hpp"
#include "DirectStreamEngine.hpp"
#include "TieredUploader.hpp"
#include "WorkerGroup.hpp"
#include "gauge_logger.h"
#include "http_client.h"

#include <algorithm>

namespace {

constexpr int kFallbackWorkers = 4;
constexpr size_t kFallbackPayloadBytes = 512 * 1024;
constexpr size_t kServerListLimit = 4 * 1024 * 1024;

// Touched by the ramp timer and run(); `open` guards late ticks
struct SizeRamp {
    std::mutex mutex;
    bool open = true;
    int launched = 0;
    size_t fileIndex = 0;
};

} // namespace

BestServerEngine::BestServerEngine(EngineSettings settings, std::string fallbackUploadUrl)
    : settings_(std::move(settings)), fallback_upload_url_(std::move(fallbackUploadUrl)) {
}

std::chrono::milliseconds BestServerEngine::phaseDuration() const {
    return std::chrono::seconds(settings_.phase_duration_sec);
}

std::string BestServerEngine::downloadUrl(const std::string& base, const std::string& file,
                                          std::uint64_t nonce) {
    return base + file + "?x=" + std::to_string(nonce);
}

std::vector<ServerEntry> BestServerEngine::fetchServerList(ResourceLifecycle& lifecycle) {
    HttpClient::Options options;
    options.connectTimeout = std::chrono::milliseconds(settings_.probe_timeout_ms);
    options.requestTimeout = std::chrono::milliseconds(settings_.probe_timeout_ms);

    auto client = std::make_shared<HttpClient>(&lifecycle.timers(), options);
    if (!lifecycle.registerClient(client)) {
        return {};
    }

    std::vector<ServerEntry> servers;
    try {
        HttpRequest request;
        request.url = Url::parse(settings_.server_list_url);
        request.headers = {{"Accept", "application/json"}};
        request.captureLimit = kServerListLimit;

        HttpResponse response = client->execute(request);
        if (response.statusCode != 200) {
            GAUGE_LOG_WARNING("best-server", "Server list returned status " +
                              std::to_string(response.statusCode));
        } else {
            json list = json::parse(response.body, nullptr, false);
            if (list.is_discarded()) {
                GAUGE_LOG_WARNING("best-server", "Server list is not valid JSON");
            } else {
                servers = BestServerDiscovery::parseServerList(list);
            }
        }
    } catch (const std::exception& e) {
        if (!lifecycle.shouldStop()) {
            GAUGE_LOG_WARNING("best-server", std::string("Server list fetch failed: ") + e.what());
        }
    }

    client->forceClose();
    lifecycle.releaseClient(client);
    return servers;
}

std::optional<json> BestServerEngine::discover(ResourceLifecycle& lifecycle) {
    std::vector<ServerEntry> servers;
    if (!settings_.server_list_url.empty()) {
        servers = fetchServerList(lifecycle);
    }
    // Configured upload endpoints stand in for, or extend, the directory
    for (const std::string& url : settings_.candidate_urls) {
        json entry = {{"url", url}};
        for (ServerEntry& server : BestServerDiscovery::parseServerList(json::array({entry}))) {
            server.name = Url::parse(server.url).host;
            servers.push_back(std::move(server));
        }
    }
    if (servers.empty()) {
        GAUGE_LOG_WARNING("best-server", "No servers to choose from");
        return std::nullopt;
    }

    std::shared_ptr<LatencySampler> sampler = sampler_;
    if (!sampler) {
        LatencyProbe::Config config;
        config.samples = kRankingSamples;
        config.interval = std::chrono::milliseconds(20);
        config.connectTimeout = std::chrono::milliseconds(settings_.probe_timeout_ms);
        config.requestTimeout = std::chrono::milliseconds(settings_.probe_timeout_ms);
        sampler = std::make_shared<ProbeLatencySampler>(config);
    }

    BestServerDiscovery::Options options;
    options.preferredCountry = settings_.preferred_country;
    options.maxCandidates = static_cast<size_t>(settings_.max_candidates);

    BestServerDiscovery discovery(std::move(servers), options, sampler);
    std::optional<json> target = discovery.run(lifecycle);
    if (target) {
        latency_url_ = (*target)["latencyUrl"].get<std::string>();
        download_base_ = (*target)["downloadBase"].get<std::string>();
    }
    return target;
}

LatencyResult BestServerEngine::measureLatency(ResourceLifecycle& lifecycle) {
    if (latency_url_.empty()) {
        return LatencyResult{};
    }

    LatencyProbe::Config config;
    config.samples = settings_.latency_samples;
    config.interval = std::chrono::milliseconds(settings_.latency_interval_ms);
    config.connectTimeout = std::chrono::milliseconds(settings_.connect_timeout_ms);

    LatencyProbe probe(config);
    return probe.measure(lifecycle, latency_url_);
}

void BestServerEngine::runDownload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                                   const json& metadata) {
    const std::string base = metadata.value("downloadBase", download_base_);
    const std::vector<std::string>& files = settings_.download_files;
    if (base.empty() || files.empty()) {
        GAUGE_LOG_WARNING("best-server", "Nothing to download");
        return;
    }

    const auto deadline = std::chrono::steady_clock::now() + phaseDuration();
    auto group = std::make_shared<WorkerGroup>("best-server");
    auto state = std::make_shared<SizeRamp>();

    // Caller holds state->mutex
    auto launch = [this, &lifecycle, &onBytes, base, files, deadline, group, state](int count) {
        const std::string file = files[state->fileIndex];
        for (int i = 0; i < count && state->launched < settings_.max_workers; ++i) {
            const int id = state->launched;
            if (!group->add([this, &lifecycle, &onBytes, base, file, id, deadline]() {
                    downloadWorker(lifecycle, onBytes, base, file, id, deadline);
                })) {
                break;
            }
            ++state->launched;
        }
        std::lock_guard<std::mutex> lock(status_mutex_);
        download_file_ = file;
    };

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        launch(settings_.min_workers);
    }

    auto rampTimer = lifecycle.timers().createPeriodic(std::chrono::milliseconds(settings_.ramp_interval_ms),
        [this, state, launch, files]() {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (!state->open || state->launched >= settings_.max_workers) {
                return;
            }
            state->fileIndex = std::min(state->fileIndex + 1, files.size() - 1);
            launch(settings_.ramp_step);
            GAUGE_LOG("best-server", "Ramped to " + std::to_string(state->launched) + " workers on " +
                      files[state->fileIndex]);
        });
    if (!lifecycle.registerTimer(rampTimer)) {
        rampTimer.reset();
    }

    lifecycle.waitForStop(std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()));

    if (rampTimer) {
        rampTimer->cancel();
        lifecycle.releaseTimer(rampTimer);
    }
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        state->open = false;
    }
    group->joinAll();

    GAUGE_LOG("best-server", "Download workers done: " + std::to_string(group->launched()) +
              " workers, " + std::to_string(nonce_.load()) + " requests");
}

void BestServerEngine::downloadWorker(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                                      const std::string& base, const std::string& file, int id,
                                      std::chrono::steady_clock::time_point deadline) {
    HttpClient::Options options;
    options.connectTimeout = std::chrono::milliseconds(settings_.connect_timeout_ms);
    // A whole image is bounded by the phase, not the request timeout
    options.requestTimeout = phaseDuration();

    auto client = std::make_shared<HttpClient>(&lifecycle.timers(), options);
    if (!lifecycle.registerClient(client)) {
        return;
    }

    if (id > 0 && id < settings_.min_workers && settings_.worker_stagger_ms > 0 &&
        lifecycle.waitForStop(std::chrono::milliseconds(settings_.worker_stagger_ms * id))) {
        lifecycle.releaseClient(client);
        return;
    }

    HttpClient::BodyCallback onBody = [&onBytes](const char*, size_t n) { onBytes(n); };

    while (!lifecycle.shouldStop() && std::chrono::steady_clock::now() < deadline) {
        HttpRequest request;
        request.url = Url::parse(downloadUrl(base, file, nonce_.fetch_add(1)));
        request.headers = {{"Cache-Control", "no-cache"}};
        try {
            HttpResponse response = client->execute(request, onBody);
            if (response.statusCode != 200) {
                GAUGE_LOG("best-server", "W" + std::to_string(id) + " " + file + " status " +
                          std::to_string(response.statusCode));
                lifecycle.waitForStop(std::chrono::milliseconds(200));
            }
        } catch (const std::exception& e) {
            if (lifecycle.shouldStop()) {
                break;
            }
            GAUGE_LOG("best-server", "W" + std::to_string(id) + ": " + e.what());
            lifecycle.waitForStop(std::chrono::milliseconds(200));
        }
    }

    client->forceClose();
    lifecycle.releaseClient(client);
}

void BestServerEngine::runUpload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                                 const json& metadata) {
    {
        std::lock_guard<std::mutex> lock(status_mutex_);
        upload_tier_.clear();
    }

    TieredUploader uploader(lifecycle, onBytes, std::chrono::milliseconds(settings_.upload_probation_ms));
    uploader.setTierChangeCallback([this](const std::string& tier) {
        std::lock_guard<std::mutex> lock(status_mutex_);
        upload_tier_ = tier;
    });

    const std::string serverUrl = metadata.value("testUrl", "");
    if (!serverUrl.empty()) {
        uploader.addTier(DirectStreamEngine::makeStreamTier(
            "server-post", {serverUrl}, settings_.upload_workers, settings_.upload_payload_bytes,
            settings_.upload_slice_bytes, settings_));
    }
    uploader.addTier(DirectStreamEngine::makeStreamTier(
        "fallback", {fallback_upload_url_}, kFallbackWorkers, kFallbackPayloadBytes,
        kFallbackPayloadBytes / 8, settings_));

    uploader.run();
}

json BestServerEngine::liveMetadata() const {
    json meta = json::object();
    std::lock_guard<std::mutex> lock(status_mutex_);
    if (!upload_tier_.empty()) {
        meta["uploadTier"] = upload_tier_;
    }
    if (!download_file_.empty()) {
        meta["downloadFile"] = download_file_;
    }
    return meta;
}
