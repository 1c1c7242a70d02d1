#include "TieredUploader.hpp"
#include "WorkerGroup.hpp"
#include "gauge_logger.h"

#include <algorithm>

namespace {
constexpr std::chrono::milliseconds kPollSlice{50};
}

// ======== TIER CONTEXT ========

TieredUploader::TierContext::TierContext(ResourceLifecycle& lifecycle,
                                         const MeasurementEngine::ByteCallback& onBytes,
                                         std::string name)
    : lifecycle_(lifecycle), on_bytes_(onBytes), name_(std::move(name)) {
}

void TieredUploader::TierContext::reportBytes(std::uint64_t n) {
    bytes_.fetch_add(n);
    if (on_bytes_) {
        on_bytes_(n);
    }
}

void TieredUploader::TierContext::confirm() {
    if (confirmed_.exchange(true)) {
        return;
    }
    GAUGE_LOG("upload", "Tier " + name_ + " confirmed");
    std::lock_guard<std::mutex> lock(mutex_);
    cv_.notify_all();
}

bool TieredUploader::TierContext::shouldStop() const {
    return retired_.load() || lifecycle_.shouldStop();
}

bool TieredUploader::TierContext::waitForStop(std::chrono::milliseconds duration) {
    const auto until = std::chrono::steady_clock::now() + duration;
    while (!shouldStop()) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= until) {
            return false;
        }
        auto slice = std::min<std::chrono::milliseconds>(
            kPollSlice, std::chrono::duration_cast<std::chrono::milliseconds>(until - now));
        if (lifecycle_.waitForStop(slice)) {
            return true;
        }
    }
    return true;
}

bool TieredUploader::TierContext::adopt(const std::shared_ptr<ManagedHandle>& handle, bool isSocket) {
    if (!handle) {
        return false;
    }

    bool registered = isSocket ? lifecycle_.registerSocket(handle) : lifecycle_.registerClient(handle);
    if (!registered) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!retired_.load()) {
            handles_.push_back({handle, isSocket});
            return true;
        }
    }

    // Retired between the two registrations
    handle->forceClose();
    if (isSocket) {
        lifecycle_.releaseSocket(handle);
    } else {
        lifecycle_.releaseClient(handle);
    }
    return false;
}

void TieredUploader::TierContext::release(const std::shared_ptr<ManagedHandle>& handle) {
    bool isSocket = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find_if(handles_.begin(), handles_.end(),
                               [&](const auto& entry) { return entry.first == handle; });
        if (it == handles_.end()) {
            return;
        }
        isSocket = it->second;
        handles_.erase(it);
    }
    if (isSocket) {
        lifecycle_.releaseSocket(handle);
    } else {
        lifecycle_.releaseClient(handle);
    }
}

void TieredUploader::TierContext::retire() {
    std::vector<std::pair<std::shared_ptr<ManagedHandle>, bool>> handles;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        retired_.store(true);
        handles.swap(handles_);
        cv_.notify_all();
    }
    for (auto& [handle, isSocket] : handles) {
        handle->forceClose();
        if (isSocket) {
            lifecycle_.releaseSocket(handle);
        } else {
            lifecycle_.releaseClient(handle);
        }
    }
}

void TieredUploader::TierContext::workerStarted() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++running_workers_;
    started_ = true;
}

void TieredUploader::TierContext::workerExited() {
    std::lock_guard<std::mutex> lock(mutex_);
    --running_workers_;
    cv_.notify_all();
}

void TieredUploader::TierContext::awaitProgress(bool untilConfirmed, std::chrono::milliseconds timeout) {
    const bool bounded = timeout.count() > 0;
    const auto until = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        if (untilConfirmed && confirmed_.load()) {
            return;
        }
        if (started_ && running_workers_ == 0) {
            return;
        }
        if (retired_.load()) {
            return;
        }
        if (bounded && std::chrono::steady_clock::now() >= until) {
            return;
        }
        // The lifecycle has no hook into this condition variable; poll it
        lock.unlock();
        bool stop = lifecycle_.shouldStop();
        lock.lock();
        if (stop) {
            return;
        }
        cv_.wait_for(lock, kPollSlice);
    }
}

// ======== UPLOADER ========

TieredUploader::TieredUploader(ResourceLifecycle& lifecycle, MeasurementEngine::ByteCallback onBytes,
                               std::chrono::milliseconds probation)
    : lifecycle_(lifecycle), on_bytes_(std::move(onBytes)), probation_(probation) {
}

void TieredUploader::addTier(Tier tier) {
    tiers_.push_back(std::move(tier));
}

void TieredUploader::run() {
    WorkerGroup group("upload");
    std::vector<std::shared_ptr<TierContext>> contexts;

    for (size_t i = 0; i < tiers_.size(); ++i) {
        if (lifecycle_.shouldStop()) {
            break;
        }

        const Tier& tier = tiers_[i];
        const bool last = i + 1 == tiers_.size();

        auto context = std::make_shared<TierContext>(lifecycle_, on_bytes_, tier.name);
        contexts.push_back(context);
        setActive(tier.name);
        GAUGE_LOG_INFO("upload", "Starting tier " + tier.name + " with " +
                       std::to_string(tier.workers) + " workers");

        const int workers = std::max(1, tier.workers);
        for (int id = 0; id < workers; ++id) {
            context->workerStarted();
            TierWorker body = tier.worker;
            bool launched = group.add([context, body, id]() {
                struct ExitGuard {
                    TierContext& ctx;
                    ~ExitGuard() { ctx.workerExited(); }
                } guard{*context};
                body(*context, id);
            });
            if (!launched) {
                context->workerExited();
            }
        }

        if (last) {
            break;
        }

        context->awaitProgress(true, probation_);
        if (lifecycle_.shouldStop()) {
            break;
        }

        if (context->isConfirmed()) {
            // Keep the tier for the rest of the phase unless its workers all die
            context->awaitProgress(false, std::chrono::milliseconds(0));
            if (lifecycle_.shouldStop()) {
                break;
            }
            GAUGE_LOG_WARNING("upload", "Tier " + tier.name + " stopped on its own, moving on");
        } else {
            GAUGE_LOG_WARNING("upload", "Tier " + tier.name + " did not confirm within " +
                              std::to_string(probation_.count()) + " ms, moving on");
        }
        context->retire();
    }

    group.joinAll();

    // Anything a worker adopted and did not release
    for (auto& context : contexts) {
        context->retire();
    }
}

std::string TieredUploader::activeTier() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return active_tier_;
}

std::vector<std::string> TieredUploader::attemptedTiers() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return attempted_;
}

void TieredUploader::setActive(const std::string& name) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        active_tier_ = name;
        attempted_.push_back(name);
    }
    if (on_tier_change_) {
        on_tier_change_(name);
    }
}
