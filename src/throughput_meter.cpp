#include "throughput_meter.h"

#include <algorithm>

ThroughputMeter::ThroughputMeter(std::chrono::milliseconds expectedDuration,
                                 size_t windowTicks,
                                 MicrosecondClock clock)
    : expected_duration_(expectedDuration),
      window_ticks_(std::min(std::max<size_t>(windowTicks, 1), kRingSize - 1)),
      clock_(clock ? std::move(clock) : MicrosecondClock(steadyClockMicros)) {
    start_us_ = clock_();
}

std::int64_t ThroughputMeter::steadyClockMicros() {
    return std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

void ThroughputMeter::start() {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    total_bytes_.store(0);
    first_data_us_.store(-1);
    stop_us_.store(-1);
    ring_us_.fill(0);
    ring_bytes_.fill(0);
    head_ = 0;
    windowed_mbps_ = 0.0;
    display_mbps_ = 0.0;
    start_us_ = clock_();
}

std::int64_t ThroughputMeter::elapsedMicros() const {
    std::int64_t stopped = stop_us_.load();
    if (stopped >= 0) {
        return stopped;
    }
    return clock_() - start_us_;
}

// ======== LAYER 1: ACCUMULATOR ========

void ThroughputMeter::addBytes(std::uint64_t n) {
    if (n == 0) {
        return;
    }
    if (first_data_us_.load() < 0) {
        std::int64_t expected = -1;
        first_data_us_.compare_exchange_strong(expected, elapsedMicros());
    }
    total_bytes_.fetch_add(n);
}

double ThroughputMeter::overallMbpsAt(std::int64_t nowUs) const {
    std::int64_t first = first_data_us_.load();
    std::uint64_t total = total_bytes_.load();
    if (first < 0 || total == 0) {
        return 0.0;
    }
    std::int64_t elapsed = nowUs - first;
    return elapsed > 0 ? (static_cast<double>(total) * 8.0) / static_cast<double>(elapsed) : 0.0;
}

double ThroughputMeter::overallMbps() const {
    return overallMbpsAt(elapsedMicros());
}

// ======== LAYERS 2 + 3: WINDOW AND DISPLAY ========

double ThroughputMeter::tick() {
    std::lock_guard<std::mutex> lock(tick_mutex_);

    std::int64_t firstUs = first_data_us_.load();
    if (firstUs < 0) {
        return display_mbps_;
    }

    const std::int64_t nowUs = elapsedMicros();
    const std::uint64_t total = total_bytes_.load();
    const size_t head = head_;

    ring_us_[head & kRingMask] = nowUs;
    ring_bytes_[head & kRingMask] = total;

    // Use as much history as exists, up to the window width
    const size_t lookback = std::min(head, window_ticks_);
    double rawMbps = 0.0;
    if (lookback > 0) {
        const size_t tail = (head - lookback) & kRingMask;
        const std::uint64_t dBytes = total - ring_bytes_[tail];
        const std::int64_t dUs = nowUs - ring_us_[tail];
        if (dUs > 0) {
            rawMbps = (static_cast<double>(dBytes) * 8.0) / static_cast<double>(dUs);
        }
    }
    windowed_mbps_ = rawMbps;
    head_ = head + 1;

    // Decay progress is measured from the first byte, not from start()
    const double expectedSec = std::max(0.001, expected_duration_.count() / 1000.0);
    const double dataElapsedSec = (nowUs - firstUs) / 1000000.0;
    const double progress = std::min(1.0, std::max(0.0, dataElapsedSec / expectedSec));
    const double decay = 1.0 - progress * kDecayFactor;

    const double steadyAlpha = (rawMbps >= display_mbps_ ? kRiseAlpha : kFallAlpha) * decay;

    double alpha = steadyAlpha;
    if (lookback < window_ticks_) {
        // Linear blend from the cold-start coefficient while the window fills
        const double warmth = static_cast<double>(lookback) / static_cast<double>(window_ticks_);
        alpha = kColdAlpha + warmth * (steadyAlpha - kColdAlpha);
    }

    display_mbps_ += alpha * (rawMbps - display_mbps_);
    if (display_mbps_ < kDisplayFloorMbps) {
        display_mbps_ = 0.0;
    }
    return display_mbps_;
}

double ThroughputMeter::finish() {
    std::int64_t expected = -1;
    stop_us_.compare_exchange_strong(expected, clock_() - start_us_);
    return overallMbps();
}

double ThroughputMeter::displayMbps() const {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    return display_mbps_;
}

double ThroughputMeter::windowedMbps() const {
    std::lock_guard<std::mutex> lock(tick_mutex_);
    return windowed_mbps_;
}
