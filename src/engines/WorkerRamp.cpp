#include "WorkerRamp.hpp"

#include <algorithm>

WorkerRamp::WorkerRamp(Settings settings)
    : settings_(settings) {
    settings_.initialWorkers = std::max(1, settings_.initialWorkers);
    settings_.maxWorkers = std::max(settings_.initialWorkers, settings_.maxWorkers);
    settings_.step = std::max(1, settings_.step);
    active_ = settings_.initialWorkers;
    stopped_ = active_ >= settings_.maxWorkers;
}

int WorkerRamp::onInterval(double aggregateMbps) {
    if (stopped_) {
        return 0;
    }

    // No plateau check until a nonzero baseline exists
    if (last_mbps_ > 0.0) {
        double growth = (aggregateMbps - last_mbps_) / last_mbps_;
        if (growth < settings_.plateauGrowth) {
            stopped_ = true;
            return 0;
        }
    }
    last_mbps_ = aggregateMbps;

    int add = std::min(settings_.step, settings_.maxWorkers - active_);
    active_ += add;
    if (active_ >= settings_.maxWorkers) {
        stopped_ = true;
    }
    return add;
}
