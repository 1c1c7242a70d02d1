#include "AdaptiveChunkController.hpp"
#include "RangeChunkDownloader.hpp"
#include "WorkerRamp.hpp"
#include "test_loopback_server.h"
#include <algorithm>
#include <atomic>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <vector>

static int failures = 0;

static void check(bool ok, const std::string& label) {
    std::cout << label << ": " << (ok ? "PASS" : "FAIL") << std::endl;
    if (!ok) {
        failures++;
    }
}

using std::chrono::milliseconds;

void testChunkController() {
    std::cout << "\n--- Test 1: Chunk Size Adaptation ---" << std::endl;

    AdaptiveChunkController::Limits limits;
    limits.minBytes = 256 * 1024;
    limits.maxBytes = 1024 * 1024;
    AdaptiveChunkController chunks(limits);

    check(chunks.chunkSize() == 256 * 1024, "Starts at the minimum");
    check(chunks.onRequestCompleted(milliseconds(100)) == 512 * 1024, "Fast request doubles");
    check(chunks.onRequestCompleted(milliseconds(100)) == 1024 * 1024, "Doubles again");
    check(chunks.onRequestCompleted(milliseconds(100)) == 1024 * 1024, "Capped at the maximum");
    check(chunks.onRequestCompleted(milliseconds(2000)) == 1024 * 1024, "Moderate request keeps the size");
    check(chunks.onRequestCompleted(milliseconds(9000)) == 512 * 1024, "Slow request halves");

    chunks.resetToMinimum();
    check(chunks.chunkSize() == 256 * 1024, "Reset returns to the minimum");
    check(chunks.onRequestCompleted(milliseconds(9000)) == 256 * 1024, "Never below the minimum");

    AdaptiveChunkController::Limits inverted;
    inverted.minBytes = 2 * 1024 * 1024;
    inverted.maxBytes = 1024 * 1024;
    AdaptiveChunkController fixed(inverted);
    check(fixed.onRequestCompleted(milliseconds(1)) == 2 * 1024 * 1024, "Inverted limits collapse to the minimum");

    std::vector<AdaptiveChunkController> workers(3, AdaptiveChunkController(limits));
    bool independent = true;
    for (auto& worker : workers) {
        const size_t first = worker.chunkSize();
        independent = independent && first == 256 * 1024 &&
                      worker.onRequestCompleted(milliseconds(50)) == 2 * first;
    }
    check(independent, "Each worker doubles its own size exactly once");
}

void testWorkerRamp() {
    std::cout << "\n--- Test 2: Worker Ramp ---" << std::endl;

    WorkerRamp ramp(WorkerRamp::Settings{4, 12, 2, 0.05});
    check(ramp.initialWorkers() == 4 && !ramp.stopped(), "Starts with the initial workers");
    check(ramp.onInterval(100.0) == 2, "First interval adds a step");
    check(ramp.onInterval(150.0) == 2, "Growing rate adds another step");
    check(ramp.activeWorkers() == 8, "Eight workers active");
    check(ramp.onInterval(152.0) == 0 && ramp.stopped(), "Plateau stops the ramp");
    check(ramp.onInterval(400.0) == 0, "Stopped ramp stays stopped");

    WorkerRamp capped(WorkerRamp::Settings{4, 7, 2, 0.05});
    capped.onInterval(100.0);
    check(capped.onInterval(200.0) == 1 && capped.activeWorkers() == 7, "Last step trimmed to the cap");
    check(capped.stopped(), "Cap reached stops the ramp");

    WorkerRamp idle(WorkerRamp::Settings{0, 0, 2, 0.05});
    check(idle.initialWorkers() == 1 && idle.stopped(), "At least one worker, nothing to ramp");

    WorkerRamp zeroStart(WorkerRamp::Settings{2, 10, 2, 0.05});
    check(zeroStart.onInterval(0.0) == 2 && zeroStart.onInterval(0.0) == 2, "No plateau without a baseline rate");
}

void testRangeStart() {
    std::cout << "\n--- Test 3: Range Offsets ---" << std::endl;

    const std::uint64_t mib = 1024 * 1024;
    check(RangeChunkDownloader::rangeStart(0, mib, 10 * mib) == 0, "First chunk at zero");
    check(RangeChunkDownloader::rangeStart(3, mib, 10 * mib) == 3 * mib, "Sequential offsets");
    check(RangeChunkDownloader::rangeStart(12, mib, 10 * mib) == 2 * mib, "Wraps at the object length");
    check(RangeChunkDownloader::rangeStart(60, mib, -1) == 10 * mib, "Unknown length wraps at 50 MiB");
}

// What the loopback object server saw
struct RangeLog {
    std::mutex mutex;
    std::map<size_t, std::vector<std::uint64_t>> lengths; // per connection
    std::vector<std::uint64_t> starts;
    std::vector<std::chrono::steady_clock::time_point> arrivals;
    std::uint64_t bodyBytesSent = 0;
};

static bool parseRange(const std::string& value, std::uint64_t& start, std::uint64_t& end) {
    if (value.compare(0, 6, "bytes=") != 0) {
        return false;
    }
    const size_t dash = value.find('-');
    if (dash == std::string::npos) {
        return false;
    }
    start = std::stoull(value.substr(6, dash - 6));
    end = std::stoull(value.substr(dash + 1));
    return end >= start;
}

static std::string partialContent(std::uint64_t start, std::uint64_t end) {
    return LoopbackHttpServer::response(206, "Partial Content", std::string(end - start + 1, 'x'),
                                        "Content-Range: bytes " + std::to_string(start) + "-" +
                                        std::to_string(end) + "/67108864\r\n");
}

static RangeChunkDownloader::Config loopbackConfig(const LoopbackHttpServer& server) {
    RangeChunkDownloader::Config config;
    config.url = server.url("/object.bin");
    config.contentLength = 64 * 1024 * 1024;
    config.connectTimeout = milliseconds(2000);
    config.requestTimeout = milliseconds(3000);
    config.workerStagger = milliseconds(10);
    config.chunks.minBytes = 256 * 1024;
    config.chunks.maxBytes = 2 * 1024 * 1024;
    return config;
}

void testPerWorkerChunkSizes() {
    std::cout << "\n--- Test 4: Ranged Workers Against a Loopback Object ---" << std::endl;

    RangeLog log;
    LoopbackHttpServer server([&log](const LoopbackHttpServer::Request& request) {
        std::uint64_t start = 0;
        std::uint64_t end = 0;
        if (!parseRange(request.header("Range"), start, end)) {
            return LoopbackHttpServer::response(400, "Bad Request", "");
        }
        std::lock_guard<std::mutex> lock(log.mutex);
        log.lengths[request.connection].push_back(end - start + 1);
        log.starts.push_back(start);
        log.bodyBytesSent += end - start + 1;
        return partialContent(start, end);
    });

    TimerService timers;
    ResourceLifecycle lifecycle(timers);
    lifecycle.beginPhase();

    RangeChunkDownloader::Config config = loopbackConfig(server);
    config.duration = milliseconds(1500);
    config.rampInterval = milliseconds(400);
    config.ramp = WorkerRamp::Settings{2, 4, 2, 0.05};

    std::atomic<std::uint64_t> reported{0};
    RangeChunkDownloader downloader(config);
    downloader.run(lifecycle, [&reported](std::uint64_t n) { reported += n; });
    server.stop();

    std::lock_guard<std::mutex> lock(log.mutex);
    check(downloader.workersLaunched() == 4, "Ramp timer added a step of workers");
    check(server.connectionCount() == 4, "One keep-alive connection per worker");

    bool sequences = log.lengths.size() == 4;
    for (const auto& entry : log.lengths) {
        const std::vector<std::uint64_t>& sizes = entry.second;
        sequences = sequences && sizes.size() >= 2 && sizes[0] == 256 * 1024 && sizes[1] == 512 * 1024;
    }
    check(sequences, "Every worker asks for 256 KiB, then 512 KiB");
    check(downloader.chunksIssued() == server.requestCount(), "One chunk index per request");
    check(std::find(log.starts.begin(), log.starts.end(), 0u) != log.starts.end(), "Chunk zero starts at offset zero");
    check(reported.load() == log.bodyBytesSent, "Every body byte reported");
}

void testStatusHandling() {
    std::cout << "\n--- Test 5: 416 Reset and 429 Backoff ---" << std::endl;

    RangeLog log;
    LoopbackHttpServer server([&log](const LoopbackHttpServer::Request& request) {
        std::uint64_t start = 0;
        std::uint64_t end = 0;
        parseRange(request.header("Range"), start, end);
        std::lock_guard<std::mutex> lock(log.mutex);
        const size_t n = log.arrivals.size();
        log.arrivals.push_back(std::chrono::steady_clock::now());
        log.lengths[request.connection].push_back(end - start + 1);
        if (n == 1) {
            return LoopbackHttpServer::response(416, "Range Not Satisfiable", "",
                                                "Content-Range: bytes */67108864\r\n");
        }
        if (n == 2) {
            return LoopbackHttpServer::response(429, "Too Many Requests", "");
        }
        log.bodyBytesSent += end - start + 1;
        return partialContent(start, end);
    });

    TimerService timers;
    ResourceLifecycle lifecycle(timers);
    lifecycle.beginPhase();

    RangeChunkDownloader::Config config = loopbackConfig(server);
    config.duration = milliseconds(3000);
    config.ramp = WorkerRamp::Settings{1, 1, 2, 0.05};

    std::atomic<std::uint64_t> reported{0};
    RangeChunkDownloader downloader(config);
    downloader.run(lifecycle, [&reported](std::uint64_t n) { reported += n; });
    server.stop();

    std::lock_guard<std::mutex> lock(log.mutex);
    const std::vector<std::uint64_t>& sizes = log.lengths[0];
    check(downloader.workersLaunched() == 1, "Single worker");
    check(sizes.size() >= 4, "Worker kept going after the errors");
    if (sizes.size() >= 4) {
        check(sizes[0] == 256 * 1024 && sizes[1] == 512 * 1024, "Fast chunk doubled the size");
        check(sizes[2] == 256 * 1024, "416 reset the size to the minimum");
        check(sizes[3] == 256 * 1024, "429 left the size alone");
        check(log.arrivals[3] - log.arrivals[2] >= milliseconds(1900), "429 backed off for two seconds");
    }
    check(reported.load() == log.bodyBytesSent, "Error responses report no bytes");
}

int main() {
    std::cout << "Testing adaptive download components..." << std::endl;

    testChunkController();
    testWorkerRamp();
    testRangeStart();
    testPerWorkerChunkSizes();
    testStatusHandling();

    std::cout << "\n" << (failures == 0 ? "All tests passed" : std::to_string(failures) + " test(s) failed") << std::endl;
    return failures == 0 ? 0 : 1;
}
