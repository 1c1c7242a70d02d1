#ifndef WORKER_RAMP_H
#define WORKER_RAMP_H

#include <cstddef>

/**
 * Worker count schedule for a download phase. Starts at `initialWorkers`,
 * grows by `step` per interval up to `maxWorkers`, and stops growing once an
 * interval brought less than `plateauGrowth` relative rate gain: past that
 * point the link, not the connection count, is the bottleneck.
 */
class WorkerRamp {
public:
    struct Settings {
        int initialWorkers = 4;
        int maxWorkers = 8;
        int step = 2;
        double plateauGrowth = 0.05;
    };

    explicit WorkerRamp(Settings settings);

    int initialWorkers() const { return settings_.initialWorkers; }
    int activeWorkers() const { return active_; }
    bool stopped() const { return stopped_; }

    // Called once per ramp interval with the aggregate rate; returns how many
    // workers to add now
    int onInterval(double aggregateMbps);

private:
    Settings settings_;
    int active_;
    bool stopped_ = false;
    double last_mbps_ = -1.0;
};

#endif // WORKER_RAMP_H
