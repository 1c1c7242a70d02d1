#include "RangeChunkDownloader.hpp"
#include "WorkerGroup.hpp"
#include "gauge_logger.h"
#include "http_client.h"
#include "measurement_errors.h"

#include <algorithm>
#include <mutex>

namespace {

// Ramp decisions happen on the timer thread. A tick only touches the
// downloader while `open` is set; run() clears it under the mutex.
struct RampState {
    std::mutex mutex;
    bool open = true;
    WorkerRamp ramp;
    std::uint64_t lastBytes = 0;
    std::chrono::steady_clock::time_point lastTick = std::chrono::steady_clock::now();
    int nextId = 0;

    explicit RampState(WorkerRamp::Settings settings) : ramp(settings) {}
};

} // namespace

RangeChunkDownloader::RangeChunkDownloader(Config config)
    : config_(std::move(config)) {
}

std::uint64_t RangeChunkDownloader::rangeStart(std::uint64_t index, std::uint64_t chunkSize,
                                               std::int64_t contentLength) {
    const std::uint64_t length = contentLength > 0 ? static_cast<std::uint64_t>(contentLength)
                                                   : kUnknownLengthWrap;
    return (index * chunkSize) % length;
}

void RangeChunkDownloader::run(ResourceLifecycle& lifecycle,
                               const MeasurementEngine::ByteCallback& onBytes) {
    const auto deadline = std::chrono::steady_clock::now() + config_.duration;
    auto group = std::make_shared<WorkerGroup>("download");
    auto state = std::make_shared<RampState>(config_.ramp);

    auto launch = [this, &lifecycle, &onBytes, deadline, group](int id) {
        if (group->add([this, &lifecycle, &onBytes, id, deadline]() {
                worker(lifecycle, onBytes, id, deadline);
            })) {
            workers_launched_.fetch_add(1);
        }
    };

    {
        std::lock_guard<std::mutex> lock(state->mutex);
        for (; state->nextId < state->ramp.initialWorkers(); ++state->nextId) {
            launch(state->nextId);
        }
        state->lastBytes = bytes_.load();
        state->lastTick = std::chrono::steady_clock::now();
    }

    std::shared_ptr<ManagedTimer> rampTimer;
    if (!state->ramp.stopped()) {
        rampTimer = lifecycle.timers().createPeriodic(config_.rampInterval,
            [this, state, launch]() {
                std::lock_guard<std::mutex> lock(state->mutex);
                if (!state->open) {
                    return;
                }
                const auto now = std::chrono::steady_clock::now();
                const std::uint64_t total = bytes_.load();
                const double us = std::chrono::duration<double, std::micro>(now - state->lastTick).count();
                const double mbps = us > 0 ? (total - state->lastBytes) * 8.0 / us : 0.0;
                state->lastBytes = total;
                state->lastTick = now;

                const int add = state->ramp.onInterval(mbps);
                for (int i = 0; i < add; ++i) {
                    launch(state->nextId++);
                }
                if (add > 0) {
                    GAUGE_LOG("download", "Ramped to " + std::to_string(state->ramp.activeWorkers()) +
                              " workers at " + std::to_string(mbps) + " Mbps");
                } else if (state->ramp.stopped()) {
                    GAUGE_LOG("download", "Ramp settled at " +
                              std::to_string(state->ramp.activeWorkers()) + " workers");
                }
            });
        if (!lifecycle.registerTimer(rampTimer)) {
            rampTimer.reset();
        }
    }

    // Workers end on their own at the deadline; the ramp only matters until then
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

    GAUGE_LOG("download", "Range workers done: " + std::to_string(workers_launched_.load()) +
              " workers, " + std::to_string(next_chunk_.load()) + " chunks");
}

void RangeChunkDownloader::worker(ResourceLifecycle& lifecycle,
                                  const MeasurementEngine::ByteCallback& onBytes, int id,
                                  std::chrono::steady_clock::time_point deadline) {
    HttpClient::Options options;
    options.connectTimeout = config_.connectTimeout;
    options.requestTimeout = config_.requestTimeout;

    auto client = std::make_shared<HttpClient>(&lifecycle.timers(), options);
    if (!lifecycle.registerClient(client)) {
        return;
    }

    // Initial workers start staggered so their handshakes do not collide
    if (id > 0 && id < config_.ramp.initialWorkers &&
        lifecycle.waitForStop(config_.workerStagger * id)) {
        lifecycle.releaseClient(client);
        return;
    }

    const Url url = Url::parse(config_.url);
    AdaptiveChunkController chunks(config_.chunks);
    std::uint64_t requests = 0;
    HttpClient::BodyCallback onBody = [this, &onBytes](const char*, size_t n) {
        bytes_.fetch_add(n);
        onBytes(n);
    };

    while (!lifecycle.shouldStop() && std::chrono::steady_clock::now() < deadline) {
        try {
            const std::uint64_t chunk = chunks.chunkSize();
            const std::uint64_t start = rangeStart(next_chunk_.fetch_add(1), chunk,
                                                   config_.contentLength);
            std::uint64_t end = start + chunk - 1;
            if (config_.contentLength > 0) {
                end = std::min<std::uint64_t>(end, static_cast<std::uint64_t>(config_.contentLength) - 1);
            }

            HttpRequest request;
            request.url = url;
            request.headers = {
                {"Range", "bytes=" + std::to_string(start) + "-" + std::to_string(end)},
                {"Cache-Control", "no-cache"}
            };

            auto started = std::chrono::steady_clock::now();
            HttpResponse response = client->execute(request, onBody);
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started);

            ++requests;
            if (response.statusCode == 200 || response.statusCode == 206) {
                chunks.onRequestCompleted(elapsed);
            } else if (response.statusCode == 416) {
                chunks.resetToMinimum();
            } else if (response.statusCode == 429) {
                lifecycle.waitForStop(std::chrono::milliseconds(2000));
            } else {
                GAUGE_LOG("download", "Worker " + std::to_string(id) + " got status " +
                          std::to_string(response.statusCode));
                lifecycle.waitForStop(std::chrono::milliseconds(500));
            }
        } catch (const std::exception& e) {
            if (lifecycle.shouldStop()) {
                break;
            }
            GAUGE_LOG("download", "Worker " + std::to_string(id) + ": " + e.what());
            lifecycle.waitForStop(std::chrono::milliseconds(200));
        }
    }

    GAUGE_LOG("download", "Worker " + std::to_string(id) + " finished after " +
              std::to_string(requests) + " requests, chunk " + std::to_string(chunks.chunkSize()) +
              " bytes");
    client->forceClose();
    lifecycle.releaseClient(client);
}
