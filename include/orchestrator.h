#ifndef ORCHESTRATOR_H
#define ORCHESTRATOR_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "measurement_engine.h"
#include "resource_lifecycle.h"
#include "throughput_meter.h"
#include "timer_service.h"
#include "unified_result.h"

/**
 * Drives any MeasurementEngine through
 *   Idle -> Discovering -> MeasuringLatency -> Downloading -> Uploading -> Done
 * skipping the phases the engine does not advertise. Discovery failure ends
 * the run in Done with an error record; user cancellation ends it in
 * Cancelled.
 *
 * Per timed phase the orchestrator owns a fresh ThroughputMeter, a kill timer
 * that calls timeoutPhase() at the phase deadline and a UI ticker that emits
 * the smoothed rate. The phase number is always meter.finish().
 *
 * The result stream ends with exactly one terminal record (done or error);
 * nothing is emitted after it.
 */
class Orchestrator {
public:
    enum class State {
        Idle,
        Discovering,
        MeasuringLatency,
        Downloading,
        Uploading,
        Done,
        Cancelled
    };

    struct Settings {
        std::chrono::milliseconds uiTick{200};
        size_t windowTicks = ThroughputMeter::kDefaultWindowTicks;
        std::chrono::milliseconds postLatencyPause{400};
        std::chrono::milliseconds interPhasePause{500};
    };

    using ResultCallback = std::function<void(const UnifiedResult&)>;

    Orchestrator();
    explicit Orchestrator(Settings settings);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Runs the pipeline on a session thread. False if a run is in progress.
    bool start(std::shared_ptr<MeasurementEngine> engine, ResultCallback callback);

    // Runs the pipeline on the calling thread and returns the terminal record
    UnifiedResult run(MeasurementEngine& engine, ResultCallback callback = nullptr);

    // Force-closes everything the run holds; the run ends in Cancelled
    void cancel();

    bool isRunning() const { return running_.load(); }
    State state() const { return state_.load(); }

    // Blocks until the session started by start() has finished
    void wait();

    UnifiedResult lastResult() const;

    static std::string stateToString(State state);

private:
    struct RunContext {
        MeasurementEngine* engine = nullptr;
        double downloadMbps = 0.0;
        double uploadMbps = 0.0;
        std::optional<double> pingMs;
        std::optional<double> jitterMs;
        json metadata = json::object();
    };

    void prepareRun(ResultCallback callback);
    UnifiedResult runPrepared(MeasurementEngine& engine);
    void executePipeline(RunContext& ctx);
    double runPhase(RunContext& ctx, bool isDownload);

    UnifiedResult makeRecord(const RunContext& ctx, const std::string& status,
                             const std::string& phase) const;
    json mergedMetadata(const RunContext& ctx) const;

    void emitCancelled(const RunContext& ctx);
    void emitError(const RunContext& ctx, const std::string& message);
    void emit(const UnifiedResult& result);

    void setState(State state);

    Settings settings_;

    TimerService timers_;
    ResourceLifecycle lifecycle_;

    std::atomic<State> state_{State::Idle};
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> phase_generation_{0};

    std::mutex emit_mutex_;
    ResultCallback callback_;
    bool terminal_emitted_ = false;
    UnifiedResult last_result_;
    mutable std::mutex last_result_mutex_;

    std::mutex session_mutex_;
    std::unique_ptr<std::thread> session_thread_;
    std::shared_ptr<MeasurementEngine> session_engine_;
};

#endif // ORCHESTRATOR_H
