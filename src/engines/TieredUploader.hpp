#ifndef TIERED_UPLOADER_H
#define TIERED_UPLOADER_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "measurement_engine.h"

/**
 * Ordered upload strategies. Each tier gets a probation window to confirm it
 * actually moves bytes; a tier that does not is retired (its workers told to
 * stop, its handles force-closed) and the next one starts. The last tier is
 * the guaranteed fallback and runs without probation.
 */
class TieredUploader {
public:
    // What a tier's workers see of the run
    class TierContext {
    public:
        TierContext(ResourceLifecycle& lifecycle, const MeasurementEngine::ByteCallback& onBytes,
                    std::string name);

        ResourceLifecycle& lifecycle() { return lifecycle_; }
        const std::string& name() const { return name_; }

        void reportBytes(std::uint64_t n);

        // The tier demonstrably moves data
        void confirm();
        bool isConfirmed() const { return confirmed_.load(); }

        // Lifecycle stop or tier retirement
        bool shouldStop() const;

        // Sleeps up to `duration`; true if the tier should stop
        bool waitForStop(std::chrono::milliseconds duration);

        // Tracks the handle with the lifecycle and with this tier. False when
        // the handle was closed on the spot because the tier already stopped.
        bool adopt(const std::shared_ptr<ManagedHandle>& handle, bool isSocket);
        void release(const std::shared_ptr<ManagedHandle>& handle);

        std::uint64_t bytesReported() const { return bytes_.load(); }

    private:
        friend class TieredUploader;

        void retire();
        void workerStarted();
        void workerExited();

        // Blocks until confirmed, all workers gone, lifecycle stop, or timeout.
        // A zero timeout waits without limit.
        void awaitProgress(bool untilConfirmed, std::chrono::milliseconds timeout);

        ResourceLifecycle& lifecycle_;
        const MeasurementEngine::ByteCallback& on_bytes_;
        std::string name_;

        std::atomic<std::uint64_t> bytes_{0};
        std::atomic<bool> confirmed_{false};
        std::atomic<bool> retired_{false};

        mutable std::mutex mutex_;
        std::condition_variable cv_;
        int running_workers_ = 0;
        bool started_ = false;
        std::vector<std::pair<std::shared_ptr<ManagedHandle>, bool>> handles_;
    };

    using TierWorker = std::function<void(TierContext& context, int workerId)>;
    using TierChangeCallback = std::function<void(const std::string& tier)>;

    struct Tier {
        std::string name;
        int workers = 1;
        TierWorker worker;
    };

    TieredUploader(ResourceLifecycle& lifecycle, MeasurementEngine::ByteCallback onBytes,
                   std::chrono::milliseconds probation);

    void addTier(Tier tier);
    void setTierChangeCallback(TierChangeCallback callback) { on_tier_change_ = std::move(callback); }

    // Blocks until every worker of every tier returned
    void run();

    std::string activeTier() const;
    std::vector<std::string> attemptedTiers() const;

private:
    void setActive(const std::string& name);

    ResourceLifecycle& lifecycle_;
    MeasurementEngine::ByteCallback on_bytes_;
    std::chrono::milliseconds probation_;
    std::vector<Tier> tiers_;
    TierChangeCallback on_tier_change_;

    mutable std::mutex state_mutex_;
    std::string active_tier_;
    std::vector<std::string> attempted_;
};

#endif // TIERED_UPLOADER_H
