#include "orchestrator.h"
#include "gauge_logger.h"
#include "measurement_errors.h"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace {

std::string formatFixed(double value, int decimals) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(decimals) << value;
    return out.str();
}

// Calls completePhase() however the engine's phase body ends
class PhaseCompletion {
public:
    explicit PhaseCompletion(ResourceLifecycle& lifecycle) : lifecycle_(lifecycle) {}
    ~PhaseCompletion() { lifecycle_.completePhase(); }

private:
    ResourceLifecycle& lifecycle_;
};

} // namespace

Orchestrator::Orchestrator()
    : Orchestrator(Settings()) {
}

Orchestrator::Orchestrator(Settings settings)
    : settings_(settings),
      lifecycle_(timers_) {
}

Orchestrator::~Orchestrator() {
    if (running_.load()) {
        cancel();
    }
    wait();
}

std::string Orchestrator::stateToString(State state) {
    switch (state) {
        case State::Idle: return "idle";
        case State::Discovering: return "discovering";
        case State::MeasuringLatency: return "measuring_latency";
        case State::Downloading: return "downloading";
        case State::Uploading: return "uploading";
        case State::Done: return "done";
        case State::Cancelled: return "cancelled";
    }
    return "unknown";
}

// ======== PUBLIC API ========

bool Orchestrator::start(std::shared_ptr<MeasurementEngine> engine, ResultCallback callback) {
    if (!engine) {
        return false;
    }

    std::lock_guard<std::mutex> lock(session_mutex_);
    if (running_.load()) {
        GAUGE_LOG_WARNING("orchestrator", "Start ignored: a run is already in progress");
        return false;
    }
    if (session_thread_ && session_thread_->joinable()) {
        session_thread_->join();
    }

    // Prepared here so isRunning() is true, and a cancel() is honoured, as
    // soon as start() returns
    prepareRun(std::move(callback));
    session_engine_ = std::move(engine);
    MeasurementEngine* raw = session_engine_.get();
    session_thread_ = std::make_unique<std::thread>([this, raw]() {
        runPrepared(*raw);
    });
    return true;
}

UnifiedResult Orchestrator::run(MeasurementEngine& engine, ResultCallback callback) {
    prepareRun(std::move(callback));
    return runPrepared(engine);
}

void Orchestrator::prepareRun(ResultCallback callback) {
    running_.store(true);
    lifecycle_.reset();
    {
        std::lock_guard<std::mutex> lock(emit_mutex_);
        callback_ = std::move(callback);
        terminal_emitted_ = false;
    }
    {
        std::lock_guard<std::mutex> lock(last_result_mutex_);
        last_result_ = UnifiedResult{};
    }
    setState(State::Idle);
}

UnifiedResult Orchestrator::runPrepared(MeasurementEngine& engine) {
    RunContext ctx;
    ctx.engine = &engine;
    ctx.metadata["engine"] = engine.engineName();

    GAUGE_LOG_INFO("orchestrator", "Starting " + engine.engineName());

    try {
        executePipeline(ctx);
    } catch (const DiscoveryFailure& e) {
        if (lifecycle_.isUserCancelled()) {
            emitCancelled(ctx);
        } else {
            GAUGE_LOG_ERROR("orchestrator", std::string("Discovery failed: ") + e.what());
            emitError(ctx, e.what());
        }
    } catch (const std::exception& e) {
        if (lifecycle_.isUserCancelled()) {
            emitCancelled(ctx);
        } else {
            GAUGE_LOG_ERROR("orchestrator", std::string("Run failed: ") + e.what());
            emitError(ctx, e.what());
        }
    }

    // Nothing of this run may outlive it
    lifecycle_.awaitAllWorkers();
    running_.store(false);

    GAUGE_LOG_INFO("orchestrator", engine.engineName() + " finished in state " +
                   stateToString(state_.load()));
    return lastResult();
}

void Orchestrator::cancel() {
    GAUGE_LOG_INFO("orchestrator", "Cancel requested");
    lifecycle_.cancel();
}

void Orchestrator::wait() {
    std::unique_ptr<std::thread> thread;
    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        thread = std::move(session_thread_);
    }
    if (thread && thread->joinable()) {
        thread->join();
    }
}

UnifiedResult Orchestrator::lastResult() const {
    std::lock_guard<std::mutex> lock(last_result_mutex_);
    return last_result_;
}

// ======== PIPELINE ========

void Orchestrator::executePipeline(RunContext& ctx) {
    MeasurementEngine& engine = *ctx.engine;

    // Phase 0: discovery
    if (engine.hasDiscovery()) {
        setState(State::Discovering);
        emit(makeRecord(ctx, "Discovering " + engine.engineName() + " endpoints...", "discovery"));

        std::optional<json> found = engine.discover(lifecycle_);
        if (lifecycle_.isUserCancelled()) {
            emitCancelled(ctx);
            return;
        }
        if (!found || !found->is_object() || found->empty()) {
            throw DiscoveryFailure(engine.engineName() + " discovery failed: no candidate target validated");
        }

        for (auto& [key, value] : found->items()) {
            ctx.metadata[key] = value;
        }
        GAUGE_LOG("orchestrator", "Discovery complete: " + found->dump());
    }

    // Phase 1: latency
    if (engine.hasLatencyTest()) {
        setState(State::MeasuringLatency);
        emit(makeRecord(ctx, "Measuring latency...", "latency"));

        LatencyResult latency = engine.measureLatency(lifecycle_);
        if (lifecycle_.isUserCancelled()) {
            emitCancelled(ctx);
            return;
        }
        ctx.pingMs = latency.pingMs;
        ctx.jitterMs = latency.jitterMs;

        GAUGE_LOG("orchestrator", "Ping: " + formatFixed(latency.pingMs, 1) + " ms, jitter: " +
                  formatFixed(latency.jitterMs, 1) + " ms");
        emit(makeRecord(ctx, "Ping: " + formatFixed(latency.pingMs, 0) + "ms", "latency"));

        if (lifecycle_.waitForCancel(settings_.postLatencyPause)) {
            emitCancelled(ctx);
            return;
        }
    }

    // Phase 2: download
    setState(State::Downloading);
    ctx.downloadMbps = runPhase(ctx, true);
    if (lifecycle_.isUserCancelled()) {
        emitCancelled(ctx);
        return;
    }
    GAUGE_LOG_INFO("orchestrator", "Download: " + formatFixed(ctx.downloadMbps, 2) + " Mbps");

    if (lifecycle_.waitForCancel(settings_.interPhasePause)) {
        emitCancelled(ctx);
        return;
    }

    // Phase 3: upload
    if (engine.hasUpload()) {
        setState(State::Uploading);
        ctx.uploadMbps = runPhase(ctx, false);
        if (lifecycle_.isUserCancelled()) {
            emitCancelled(ctx);
            return;
        }
        GAUGE_LOG_INFO("orchestrator", "Upload: " + formatFixed(ctx.uploadMbps, 2) + " Mbps");
    }

    setState(State::Done);
    UnifiedResult done = makeRecord(ctx, "Complete", "done");
    done.done = true;
    emit(done);
}

double Orchestrator::runPhase(RunContext& ctx, bool isDownload) {
    MeasurementEngine& engine = *ctx.engine;
    const std::string label = isDownload ? "Download" : "Upload";
    const std::string phaseName = isDownload ? "download" : "upload";
    const auto duration = engine.phaseDuration();

    if (isDownload) {
        ctx.downloadMbps = 0.0;
    }
    ctx.uploadMbps = 0.0;
    emit(makeRecord(ctx, "Starting " + label + "...", phaseName));

    auto meter = std::make_shared<ThroughputMeter>(duration, settings_.windowTicks);
    lifecycle_.beginPhase();
    meter->start();

    const std::uint64_t generation = ++phase_generation_;

    // Kill timer: force-close everything at the deadline
    auto killTimer = timers_.createOneShot(duration, [this, generation, label]() {
        if (phase_generation_.load() != generation) {
            return;
        }
        GAUGE_LOG("orchestrator", label + " kill timer fired, timing out phase");
        lifecycle_.timeoutPhase();
    });
    lifecycle_.registerTimer(killTimer);

    // UI ticker: live smoothed rate
    const RunContext snapshot = ctx;
    auto uiTimer = timers_.createPeriodic(settings_.uiTick,
        [this, generation, meter, snapshot, isDownload, label, phaseName]() {
            if (phase_generation_.load() != generation || lifecycle_.shouldStop()) {
                return;
            }
            const double live = meter->tick();
            RunContext view = snapshot;
            if (isDownload) {
                view.downloadMbps = live;
            } else {
                view.uploadMbps = live;
            }
            emit(makeRecord(view, "Testing " + label + "...", phaseName));
        });
    lifecycle_.registerTimer(uiTimer);

    // Engine work, tracked like any other worker
    const json metadata = ctx.metadata;
    lifecycle_.launchWorker([this, &engine, meter, metadata, isDownload]() {
        PhaseCompletion completion(lifecycle_);
        auto onBytes = [meter](std::uint64_t n) { meter->addBytes(n); };
        if (isDownload) {
            engine.runDownload(lifecycle_, onBytes, metadata);
        } else {
            engine.runUpload(lifecycle_, onBytes, metadata);
        }
    });

    lifecycle_.awaitPhaseComplete();
    lifecycle_.awaitAllWorkers();

    // Retire this phase's timers before the next phase can begin
    ++phase_generation_;
    killTimer->cancel();
    uiTimer->cancel();
    lifecycle_.releaseTimer(killTimer);
    lifecycle_.releaseTimer(uiTimer);

    const double mbps = meter->finish();
    if (lifecycle_.isTimedOut()) {
        GAUGE_LOG("orchestrator", label + " ended by timeout after " +
                  std::to_string(meter->totalBytes()) + " bytes");
    }

    if (isDownload) {
        ctx.downloadMbps = mbps;
    } else {
        ctx.uploadMbps = mbps;
    }
    return mbps;
}

// ======== RESULTS ========

json Orchestrator::mergedMetadata(const RunContext& ctx) const {
    json merged = ctx.metadata;
    json live = ctx.engine ? ctx.engine->liveMetadata() : json::object();
    if (live.is_object()) {
        for (auto& [key, value] : live.items()) {
            merged[key] = value;
        }
    }
    return merged;
}

UnifiedResult Orchestrator::makeRecord(const RunContext& ctx, const std::string& status,
                                       const std::string& phase) const {
    UnifiedResult result;
    result.downloadMbps = std::max(0.0, ctx.downloadMbps);
    result.uploadMbps = std::max(0.0, ctx.uploadMbps);
    result.pingMs = ctx.pingMs;
    result.jitterMs = ctx.jitterMs;
    result.status = status;
    result.phase = phase;
    result.metadata = mergedMetadata(ctx);
    return result;
}

void Orchestrator::emitCancelled(const RunContext& ctx) {
    setState(State::Cancelled);
    UnifiedResult cancelled = makeRecord(ctx, "Cancelled", "cancelled");
    cancelled.done = true;
    emit(cancelled);
}

void Orchestrator::emitError(const RunContext& ctx, const std::string& message) {
    setState(State::Done);
    RunContext zeroed = ctx;
    zeroed.downloadMbps = 0.0;
    zeroed.uploadMbps = 0.0;
    UnifiedResult failed = makeRecord(zeroed, "Error", "done");
    failed.error = message;
    emit(failed);
}

void Orchestrator::emit(const UnifiedResult& result) {
    std::lock_guard<std::mutex> lock(emit_mutex_);
    if (terminal_emitted_) {
        return;
    }
    if (result.isTerminal()) {
        terminal_emitted_ = true;
    }

    {
        std::lock_guard<std::mutex> resultLock(last_result_mutex_);
        last_result_ = result;
    }

    if (callback_) {
        try {
            callback_(result);
        } catch (const std::exception& e) {
            GAUGE_LOG_ERROR("orchestrator", std::string("Result callback failed: ") + e.what());
        }
    }
}

void Orchestrator::setState(State state) {
    State previous = state_.exchange(state);
    if (previous != state && IS_GAUGE_LOGGING_ENABLED("orchestrator")) {
        GAUGE_LOG("orchestrator", "State " + stateToString(previous) + " -> " + stateToString(state));
    }
}
