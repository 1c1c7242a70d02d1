#ifndef RANGE_CHUNK_DOWNLOADER_H
#define RANGE_CHUNK_DOWNLOADER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "AdaptiveChunkController.hpp"
#include "WorkerRamp.hpp"
#include "measurement_engine.h"

/**
 * Parallel ranged GETs against one large cached object.
 *
 * Workers pull chunk indices from one shared counter and fetch
 * [index * chunk mod length, +chunk). Each worker sizes its own chunks from
 * its own request durations, and the worker count ramps on a timer until the
 * aggregate rate plateaus or the maximum is reached.
 */
class RangeChunkDownloader {
public:
    struct Config {
        std::string url;
        std::int64_t contentLength = -1;
        std::chrono::milliseconds duration{15000};
        std::chrono::milliseconds connectTimeout{5000};
        std::chrono::milliseconds requestTimeout{10000};
        std::chrono::milliseconds workerStagger{150};
        std::chrono::milliseconds rampInterval{2000};
        WorkerRamp::Settings ramp;
        AdaptiveChunkController::Limits chunks;
    };

    // Wrap point when the object size is unknown
    static constexpr std::uint64_t kUnknownLengthWrap = 50ULL * 1024 * 1024;

    explicit RangeChunkDownloader(Config config);

    // Blocks until every worker returned
    void run(ResourceLifecycle& lifecycle, const MeasurementEngine::ByteCallback& onBytes);

    static std::uint64_t rangeStart(std::uint64_t index, std::uint64_t chunkSize,
                                    std::int64_t contentLength);

    std::uint64_t chunksIssued() const { return next_chunk_.load(); }
    int workersLaunched() const { return workers_launched_.load(); }

private:
    void worker(ResourceLifecycle& lifecycle, const MeasurementEngine::ByteCallback& onBytes,
                int id, std::chrono::steady_clock::time_point deadline);

    Config config_;
    std::atomic<std::uint64_t> next_chunk_{0};
    std::atomic<std::uint64_t> bytes_{0};
    std::atomic<int> workers_launched_{0};
};

#endif // RANGE_CHUNK_DOWNLOADER_H
