#ifndef THROUGHPUT_METER_H
#define THROUGHPUT_METER_H

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

/**
 * Converts a byte-arrival stream into a true average and a human-stable
 * display rate. One instance per phase.
 *
 *   Layer 1 - Accumulator: monotonic clock + atomic byte counter (ground truth)
 *   Layer 2 - Estimator:   sliding window over a 64-slot ring of
 *                          (time, cumulativeBytes) samples, 15 ticks wide
 *   Layer 3 - Display EMA: asymmetric, decaying, cold-start blended smoothing
 *
 * addBytes() may be called from any number of workers. tick() is called by the
 * UI timer, finish() by the orchestrator once the phase is over.
 *
 * All rates are Mbps: bytes * 8 / microseconds.
 */
class ThroughputMeter {
public:
    // Monotonic microseconds; replaced by a fake clock in tests
    using MicrosecondClock = std::function<std::int64_t()>;

    static constexpr size_t kRingSize = 64;
    static constexpr size_t kRingMask = kRingSize - 1;
    static constexpr size_t kDefaultWindowTicks = 15;

    static constexpr double kRiseAlpha = 0.15;
    static constexpr double kFallAlpha = 0.08;
    static constexpr double kColdAlpha = 0.30;
    static constexpr double kDecayFactor = 0.7;
    static constexpr double kDisplayFloorMbps = 0.01;

    explicit ThroughputMeter(std::chrono::milliseconds expectedDuration,
                             size_t windowTicks = kDefaultWindowTicks,
                             MicrosecondClock clock = steadyClockMicros);

    // Resets every layer and starts the clock
    void start();

    // Only write path. Call when bytes are confirmed on the wire, never at
    // buffer-enqueue time.
    void addBytes(std::uint64_t n);

    // Records a sample and returns the smoothed display rate
    double tick();

    // Stops the clock and returns the true average since the first byte
    double finish();

    double displayMbps() const;
    double windowedMbps() const;
    double overallMbps() const;
    std::uint64_t totalBytes() const { return total_bytes_.load(); }
    bool hasData() const { return first_data_us_.load() >= 0; }

    static std::int64_t steadyClockMicros();

private:
    std::int64_t elapsedMicros() const;
    double overallMbpsAt(std::int64_t nowUs) const;

    std::chrono::milliseconds expected_duration_;
    size_t window_ticks_;
    MicrosecondClock clock_;

    // Layer 1
    std::int64_t start_us_ = 0;
    std::atomic<std::int64_t> stop_us_{-1};
    std::atomic<std::uint64_t> total_bytes_{0};
    std::atomic<std::int64_t> first_data_us_{-1};

    // Layer 2 and 3 (touched by tick()/finish() only)
    mutable std::mutex tick_mutex_;
    std::array<std::int64_t, kRingSize> ring_us_{};
    std::array<std::uint64_t, kRingSize> ring_bytes_{};
    size_t head_ = 0;
    double windowed_mbps_ = 0.0;
    double display_mbps_ = 0.0;
};

#endif // THROUGHPUT_METER_H
