#include "TieredUploader.hpp"
#include "UploadWorkers.hpp"
#include "test_loopback_server.h"
#include <atomic>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

static int failures = 0;

static void check(bool ok, const std::string& label) {
    std::cout << label << ": " << (ok ? "PASS" : "FAIL") << std::endl;
    if (!ok) {
        failures++;
    }
}

class FakeHandle : public ManagedHandle {
public:
    void forceClose() override { closes.fetch_add(1); }
    std::atomic<int> closes{0};
};

// Never confirms; idles until told to stop
static void silentWorker(TieredUploader::TierContext& ctx, int) {
    while (!ctx.waitForStop(std::chrono::milliseconds(20))) {
    }
}

// Moves bytes and confirms on the first one
static void movingWorker(TieredUploader::TierContext& ctx, int) {
    do {
        ctx.reportBytes(64 * 1024);
        ctx.confirm();
    } while (!ctx.waitForStop(std::chrono::milliseconds(10)));
}

// Runs the uploader until the phase deadline
static void runPhase(TieredUploader& uploader, ResourceLifecycle& lifecycle, int ms) {
    lifecycle.beginPhase();
    std::thread runner([&uploader]() { uploader.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    lifecycle.timeoutPhase();
    runner.join();
}

void testUnconfirmedTierFallsBack() {
    std::cout << "\n--- Test 1: Unconfirmed Tier Falls Back ---" << std::endl;

    TimerService timers;
    ResourceLifecycle lifecycle(timers);
    std::atomic<std::uint64_t> total{0};
    TieredUploader uploader(lifecycle, [&](std::uint64_t n) { total += n; }, std::chrono::milliseconds(200));

    auto handle = std::make_shared<FakeHandle>();
    uploader.addTier({"primary", 2, [&](TieredUploader::TierContext& ctx, int id) {
        if (id == 0) {
            ctx.adopt(handle, false);
        }
        silentWorker(ctx, id);
    }});
    uploader.addTier({"fallback", 1, movingWorker});

    std::vector<std::string> changes;
    uploader.setTierChangeCallback([&](const std::string& tier) { changes.push_back(tier); });

    runPhase(uploader, lifecycle, 600);

    auto attempted = uploader.attemptedTiers();
    check(attempted.size() == 2 && attempted[0] == "primary" && attempted[1] == "fallback", "Both tiers attempted in order");
    check(uploader.activeTier() == "fallback", "Fallback is the active tier");
    check(changes == attempted, "Tier change callback fired per tier");
    check(total.load() > 0, "Fallback bytes reached the meter");
    check(handle->closes == 1, "Retired tier's handle force-closed once");
}

void testConfirmedTierStays() {
    std::cout << "\n--- Test 2: Confirmed Tier Stays ---" << std::endl;

    TimerService timers;
    ResourceLifecycle lifecycle(timers);
    std::atomic<std::uint64_t> total{0};
    TieredUploader uploader(lifecycle, [&](std::uint64_t n) { total += n; }, std::chrono::milliseconds(200));

    std::atomic<int> fallbackRuns{0};
    uploader.addTier({"primary", 3, movingWorker});
    uploader.addTier({"fallback", 1, [&](TieredUploader::TierContext& ctx, int id) {
        fallbackRuns++;
        movingWorker(ctx, id);
    }});

    runPhase(uploader, lifecycle, 500);

    check(uploader.attemptedTiers().size() == 1, "Only the primary tier attempted");
    check(uploader.activeTier() == "primary", "Primary remains active");
    check(fallbackRuns.load() == 0, "Fallback never started");
    check(total.load() > 0, "Bytes reported");
}

void testConfirmedTierDying() {
    std::cout << "\n--- Test 3: Confirmed Tier Whose Workers Exit ---" << std::endl;

    TimerService timers;
    ResourceLifecycle lifecycle(timers);
    TieredUploader uploader(lifecycle, nullptr, std::chrono::milliseconds(2000));

    uploader.addTier({"primary", 2, [](TieredUploader::TierContext& ctx, int) {
        ctx.reportBytes(1000);
        ctx.confirm();
    }});
    uploader.addTier({"fallback", 1, movingWorker});

    runPhase(uploader, lifecycle, 400);

    check(uploader.attemptedTiers().size() == 2, "Moved on once the tier went quiet");
    check(uploader.activeTier() == "fallback", "Fallback took over");
}

void testCancelDuringProbation() {
    std::cout << "\n--- Test 4: Cancel During Probation ---" << std::endl;

    TimerService timers;
    ResourceLifecycle lifecycle(timers);
    TieredUploader uploader(lifecycle, nullptr, std::chrono::milliseconds(5000));

    uploader.addTier({"primary", 2, silentWorker});
    uploader.addTier({"fallback", 1, movingWorker});

    lifecycle.beginPhase();
    auto started = std::chrono::steady_clock::now();
    std::thread runner([&uploader]() { uploader.run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    lifecycle.cancel();
    runner.join();
    auto elapsed = std::chrono::steady_clock::now() - started;

    check(elapsed < std::chrono::seconds(1), "Run returns promptly");
    check(uploader.attemptedTiers().size() == 1, "No further tier after cancel");
}

// Runs one tier worker on its own until the phase deadline
static void runWorker(ResourceLifecycle& lifecycle, const std::function<void()>& worker, int ms) {
    lifecycle.beginPhase();
    std::thread runner(worker);
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    lifecycle.timeoutPhase();
    runner.join();
}

struct SeenRequests {
    std::mutex mutex;
    std::vector<LoopbackHttpServer::Request> requests;

    void add(const LoopbackHttpServer::Request& request) {
        std::lock_guard<std::mutex> lock(mutex);
        requests.push_back(request);
    }
};

void testPostLoopRotation() {
    std::cout << "\n--- Test 5: POST Loop Against a Loopback Target ---" << std::endl;

    SeenRequests seen;
    LoopbackHttpServer server([&seen](const LoopbackHttpServer::Request& request) {
        seen.add(request);
        if (request.target == "/reject") {
            return LoopbackHttpServer::response(403, "Forbidden", "");
        }
        return LoopbackHttpServer::response(200, "OK", "ok");
    });

    TimerService timers;
    ResourceLifecycle lifecycle(timers);
    std::atomic<std::uint64_t> total{0};
    MeasurementEngine::ByteCallback onBytes = [&total](std::uint64_t n) { total += n; };
    TieredUploader::TierContext context(lifecycle, onBytes, "post");

    PostLoopConfig config;
    config.urls = {server.url("/reject"), server.url("/accept")};
    config.payload = makeUploadPayload(64 * 1024);
    config.sliceBytes = 16 * 1024;
    config.connectTimeout = std::chrono::milliseconds(2000);
    config.requestTimeout = std::chrono::milliseconds(3000);

    runWorker(lifecycle, [&]() { runPostLoop(context, config, 0); }, 500);
    server.stop();

    std::lock_guard<std::mutex> lock(seen.mutex);
    check(context.isConfirmed(), "Accepted POST confirmed the tier");
    check(seen.requests.size() >= 2 && seen.requests[0].target == "/reject", "First POST went to the first target");
    bool stayed = seen.requests.size() >= 2;
    for (size_t i = 1; i < seen.requests.size(); ++i) {
        stayed = stayed && seen.requests[i].target == "/accept";
    }
    check(stayed, "Rotated past the rejecting target and stayed");
    check(seen.requests.size() >= 2 && seen.requests[1].bodyBytes == 64 * 1024, "Whole payload received");
    check(seen.requests.size() >= 1 && seen.requests[0].header("Content-Type") == "application/octet-stream",
          "Binary content type");
    check(context.bytesReported() == total.load() && total.load() >= 64 * 1024, "Slices reached the meter");
}

void testEdgeSocketWriter() {
    std::cout << "\n--- Test 6: Edge Socket Writer ---" << std::endl;

    SeenRequests seen;
    LoopbackHttpServer server([&seen](const LoopbackHttpServer::Request& request) {
        seen.add(request);
        return LoopbackHttpServer::response(200, "OK", "");
    });

    TimerService timers;
    ResourceLifecycle lifecycle(timers);
    std::atomic<std::uint64_t> total{0};
    MeasurementEngine::ByteCallback onBytes = [&total](std::uint64_t n) { total += n; };
    TieredUploader::TierContext context(lifecycle, onBytes, "edge-socket");

    EdgeSocketConfig config;
    config.edgeIp = "127.0.0.1";
    config.host = "upload.example.net";
    config.port = server.port();
    config.tls = false;
    config.declaredLength = 1024 * 1024;
    config.chunk = makeUploadPayload(64 * 1024);
    config.connectTimeout = std::chrono::milliseconds(2000);

    runWorker(lifecycle, [&]() { runEdgeSocketWriter(context, config, 0); }, 500);
    server.stop();

    std::lock_guard<std::mutex> lock(seen.mutex);
    check(context.isConfirmed(), "First written chunk confirmed the tier");
    check(server.connectionCount() >= 2, "Reconnected once the declared body was spent");
    check(!seen.requests.empty() && seen.requests[0].header("Host") == "upload.example.net",
          "Host header names the site, not the address");
    check(!seen.requests.empty() && seen.requests[0].bodyBytes == 1024 * 1024, "Declared body written in full");
    check(context.bytesReported() == total.load() && total.load() >= 1024 * 1024, "Chunks reached the meter");
}

void testPersistentPost() {
    std::cout << "\n--- Test 7: Persistent POST Over One Connection ---" << std::endl;

    SeenRequests seen;
    LoopbackHttpServer server([&seen](const LoopbackHttpServer::Request& request) {
        seen.add(request);
        return LoopbackHttpServer::response(200, "OK", "{}");
    });

    TimerService timers;
    ResourceLifecycle lifecycle(timers);
    std::atomic<std::uint64_t> total{0};
    MeasurementEngine::ByteCallback onBytes = [&total](std::uint64_t n) { total += n; };
    TieredUploader::TierContext context(lifecycle, onBytes, "persistent-post");

    PersistentPostConfig config;
    config.url = server.url("/ingest");
    config.payload = makeUploadPayload(64 * 1024);
    config.sliceBytes = 16 * 1024;
    config.connectTimeout = std::chrono::milliseconds(2000);

    runWorker(lifecycle, [&]() { runPersistentPost(context, config, 0); }, 500);
    server.stop();

    std::lock_guard<std::mutex> lock(seen.mutex);
    check(context.isConfirmed(), "Completed response confirmed the tier");
    check(seen.requests.size() >= 2, "Several POSTs completed");
    check(server.connectionCount() == 1, "Every POST reused one connection");
    check(!seen.requests.empty() && seen.requests[0].header("User-Agent") == "edgegauge/1.0", "User agent sent");
    check(!seen.requests.empty() && seen.requests[0].bodyBytes == 64 * 1024, "Whole payload received");
    check(context.bytesReported() == total.load() && total.load() >= 2 * 64 * 1024, "Slices reached the meter");
}

int main() {
    std::cout << "Testing TieredUploader..." << std::endl;

    testUnconfirmedTierFallsBack();
    testConfirmedTierStays();
    testConfirmedTierDying();
    testCancelDuringProbation();
    testPostLoopRotation();
    testEdgeSocketWriter();
    testPersistentPost();

    std::cout << "\n" << (failures == 0 ? "All tests passed" : std::to_string(failures) + " test(s) failed") << std::endl;
    return failures == 0 ? 0 : 1;
}
