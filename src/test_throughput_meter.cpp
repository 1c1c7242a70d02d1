#include "throughput_meter.h"
#include <cmath>
#include <iostream>
#include <string>

static int failures = 0;

static void check(bool ok, const std::string& label) {
    std::cout << label << ": " << (ok ? "PASS" : "FAIL") << std::endl;
    if (!ok) {
        failures++;
    }
}

static bool within(double value, double expected, double fraction) {
    return std::fabs(value - expected) <= expected * fraction;
}

// 4 workers, 1e6 bytes each per 100 ms step, one tick per step
void testSteadyRate() {
    std::cout << "\n--- Test 1: Steady 320 Mbps ---" << std::endl;

    std::int64_t now = 0;
    ThroughputMeter meter(std::chrono::seconds(15), 15, [&now]() { return now; });
    meter.start();

    double display = 0.0;
    bool neverNegative = true;
    bool neverOvershoots = true;
    for (int step = 0; step < 30; ++step) {
        for (int worker = 0; worker < 4; ++worker) {
            meter.addBytes(1000000);
        }
        now += 100000;
        display = meter.tick();
        neverNegative = neverNegative && display >= 0.0;
        neverOvershoots = neverOvershoots && display <= 320.0 * 1.0001;
    }

    std::cout << "Windowed: " << meter.windowedMbps() << " Mbps, display: " << display << " Mbps" << std::endl;
    check(within(meter.windowedMbps(), 320.0, 0.01), "Windowed rate within 1% of 320");
    check(neverNegative, "Display never negative");
    check(neverOvershoots, "Display never above the true rate");
    check(display > 0.0, "Display follows the input");

    const double final = meter.finish();
    std::cout << "Final: " << final << " Mbps" << std::endl;
    check(within(final, 320.0, 0.01), "finish() within 1% of 320");
    check(meter.totalBytes() == 120000000ULL, "Accumulator holds every byte");
}

// Same bytes per step, delivered as one call or as many small ones
void testGranularityInvariance() {
    std::cout << "\n--- Test 2: Granularity Invariance ---" << std::endl;

    std::int64_t nowA = 0;
    std::int64_t nowB = 0;
    ThroughputMeter coarse(std::chrono::seconds(15), 15, [&nowA]() { return nowA; });
    ThroughputMeter fine(std::chrono::seconds(15), 15, [&nowB]() { return nowB; });
    coarse.start();
    fine.start();

    for (int step = 0; step < 20; ++step) {
        coarse.addBytes(4000000);
        for (int i = 0; i < 400; ++i) {
            fine.addBytes(10000);
        }
        nowA += 100000;
        nowB += 100000;
        coarse.tick();
        fine.tick();
    }

    check(coarse.totalBytes() == fine.totalBytes(), "Same total");
    check(std::fabs(coarse.windowedMbps() - fine.windowedMbps()) < 1e-9, "Same windowed rate");
    check(std::fabs(coarse.displayMbps() - fine.displayMbps()) < 1e-9, "Same display rate");
    check(std::fabs(coarse.finish() - fine.finish()) < 1e-9, "Same final rate");
}

void testStallAndEmpty() {
    std::cout << "\n--- Test 3: Stall and Empty Phase ---" << std::endl;

    std::int64_t now = 0;
    ThroughputMeter meter(std::chrono::seconds(15), 15, [&now]() { return now; });
    meter.start();

    check(meter.tick() == 0.0, "Tick before any byte is zero");
    check(!meter.hasData(), "No data before the first byte");
    now += 500000;
    check(meter.finish() == 0.0, "Empty phase finishes at zero");

    meter.start();
    for (int step = 0; step < 10; ++step) {
        meter.addBytes(2000000);
        now += 100000;
        meter.tick();
    }
    check(meter.hasData(), "First byte recorded");
    bool nonNegative = true;
    for (int step = 0; step < 40; ++step) {
        now += 100000;
        nonNegative = nonNegative && meter.tick() >= 0.0;
    }
    check(nonNegative, "Display stays non-negative through a stall");
    check(meter.windowedMbps() == 0.0, "Windowed rate drops to zero once the window is idle");
    check(meter.finish() > 0.0, "Stall keeps the true average positive");
}

int main() {
    std::cout << "Testing ThroughputMeter..." << std::endl;

    testSteadyRate();
    testGranularityInvariance();
    testStallAndEmpty();

    std::cout << "\n" << (failures == 0 ? "All tests passed" : std::to_string(failures) + " test(s) failed") << std::endl;
    return failures == 0 ? 0 : 1;
}
