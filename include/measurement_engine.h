#ifndef MEASUREMENT_ENGINE_H
#define MEASUREMENT_ENGINE_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "resource_lifecycle.h"

using json = nlohmann::json;

struct LatencyResult {
    double pingMs = 0.0;
    double jitterMs = 0.0;
};

/**
 * Contract between a measurement strategy and the Orchestrator.
 *
 * An engine knows how to talk to its targets and nothing else: it never owns
 * a ThroughputMeter, a kill timer, a UI timer or the result stream. It reports
 * progress only through onBytes(n), once per transfer unit confirmed on the
 * wire, and it registers every client, socket and timer it creates with the
 * lifecycle it is handed.
 *
 * runDownload()/runUpload() block until every worker they started has
 * returned. Workers treat a failed read or write after shouldStop() as the
 * stop signal.
 */
class MeasurementEngine {
public:
    using ByteCallback = std::function<void(std::uint64_t)>;

    virtual ~MeasurementEngine() = default;

    virtual std::string engineName() const = 0;

    virtual bool hasDiscovery() const { return false; }
    virtual bool hasLatencyTest() const { return false; }
    virtual bool hasUpload() const { return true; }

    virtual std::chrono::milliseconds phaseDuration() const { return std::chrono::seconds(15); }

    // Target descriptor passed read-only to both phases, or nullopt when no
    // candidate validated
    virtual std::optional<json> discover(ResourceLifecycle& lifecycle) {
        (void)lifecycle;
        return json::object();
    }

    virtual LatencyResult measureLatency(ResourceLifecycle& lifecycle) {
        (void)lifecycle;
        return LatencyResult{};
    }

    virtual void runDownload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                             const json& metadata) = 0;
    virtual void runUpload(ResourceLifecycle& lifecycle, const ByteCallback& onBytes,
                           const json& metadata) = 0;

    // Facts observed while a phase runs (e.g. the active upload tier). Merged
    // into the metadata of every result the Orchestrator emits.
    virtual json liveMetadata() const { return json::object(); }
};

#endif // MEASUREMENT_ENGINE_H
