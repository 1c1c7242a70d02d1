#include "resource_lifecycle.h"
#include "gauge_logger.h"

#include <algorithm>

ResourceLifecycle::ResourceLifecycle(TimerService& timers)
    : timers_(timers) {
}

ResourceLifecycle::~ResourceLifecycle() {
    std::vector<std::shared_ptr<ManagedHandle>> leftovers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leftovers = takeAllHandlesLocked();
    }
    destroyHandles(leftovers);
    awaitAllWorkers();
}

bool ResourceLifecycle::isUserCancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return user_cancelled_;
}

bool ResourceLifecycle::isTimedOut() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timed_out_;
}

bool ResourceLifecycle::shouldStop() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return user_cancelled_ || timed_out_;
}

// ======== REGISTRATION ========

bool ResourceLifecycle::registerClient(const std::shared_ptr<ManagedHandle>& client) {
    return registerHandle(clients_, client);
}

bool ResourceLifecycle::registerSocket(const std::shared_ptr<ManagedHandle>& socket) {
    return registerHandle(sockets_, socket);
}

bool ResourceLifecycle::registerTimer(const std::shared_ptr<ManagedHandle>& timer) {
    return registerHandle(timer_handles_, timer);
}

void ResourceLifecycle::releaseClient(const std::shared_ptr<ManagedHandle>& client) {
    releaseHandle(clients_, client);
}

void ResourceLifecycle::releaseSocket(const std::shared_ptr<ManagedHandle>& socket) {
    releaseHandle(sockets_, socket);
}

void ResourceLifecycle::releaseTimer(const std::shared_ptr<ManagedHandle>& timer) {
    releaseHandle(timer_handles_, timer);
}

size_t ResourceLifecycle::trackedHandleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clients_.size() + sockets_.size() + timer_handles_.size();
}

bool ResourceLifecycle::registerHandle(std::vector<std::shared_ptr<ManagedHandle>>& registry,
                                       const std::shared_ptr<ManagedHandle>& handle) {
    if (!handle) {
        return false;
    }

    {
        // The stop check and the insertion share one critical section with
        // the teardown sweep, so a handle is either swept or never tracked.
        std::lock_guard<std::mutex> lock(mutex_);
        if (!(user_cancelled_ || timed_out_)) {
            registry.push_back(handle);
            return true;
        }
    }

    handle->forceClose();
    return false;
}

void ResourceLifecycle::releaseHandle(std::vector<std::shared_ptr<ManagedHandle>>& registry,
                                      const std::shared_ptr<ManagedHandle>& handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    registry.erase(std::remove(registry.begin(), registry.end(), handle), registry.end());
}

// ======== WORKERS ========

void ResourceLifecycle::launchWorker(WorkerBody body) {
    auto future = std::async(std::launch::async, [body = std::move(body)]() {
        try {
            body();
        } catch (const std::exception& e) {
            // Forced-close errors are the normal way workers die on teardown
            GAUGE_LOG("lifecycle", std::string("Worker ended with: ") + e.what());
        }
    });

    std::lock_guard<std::mutex> lock(workers_mutex_);
    workers_.push_back(std::move(future));
}

void ResourceLifecycle::awaitAllWorkers() {
    // Workers may launch further workers; drain until nothing is left
    for (;;) {
        std::vector<std::future<void>> pending;
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            pending.swap(workers_);
        }
        if (pending.empty()) {
            return;
        }
        for (auto& worker : pending) {
            worker.wait();
        }
    }
}

// ======== PHASE GATE ========

void ResourceLifecycle::beginPhase() {
    std::lock_guard<std::mutex> lock(mutex_);
    // Timeout is phase-scoped; user cancellation is not
    timed_out_ = false;
    phase_active_ = true;
    phase_complete_ = user_cancelled_;
}

void ResourceLifecycle::completePhase() {
    std::lock_guard<std::mutex> lock(mutex_);
    completePhaseLocked();
}

void ResourceLifecycle::completePhaseLocked() {
    if (phase_active_ && !phase_complete_) {
        phase_complete_ = true;
    }
    state_cv_.notify_all();
}

void ResourceLifecycle::awaitPhaseComplete() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!phase_active_) {
        return;
    }
    state_cv_.wait(lock, [this]() { return phase_complete_; });
}

// ======== TEARDOWN ========

void ResourceLifecycle::timeoutPhase() {
    std::vector<std::shared_ptr<ManagedHandle>> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (user_cancelled_ || timed_out_) {
            return;
        }
        timed_out_ = true;
        doomed = takeAllHandlesLocked();
    }

    GAUGE_LOG("lifecycle", "Phase timeout: force-closing " + std::to_string(doomed.size()) + " handles");
    destroyHandles(doomed);
    completePhase();
}

void ResourceLifecycle::cancel() {
    std::vector<std::shared_ptr<ManagedHandle>> doomed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (user_cancelled_) {
            return;
        }
        // After a timeout the registries are already empty and every new
        // registration is refused, so only the flag changes here.
        user_cancelled_ = true;
        doomed = takeAllHandlesLocked();
    }

    GAUGE_LOG("lifecycle", "Cancel: force-closing " + std::to_string(doomed.size()) + " handles");
    destroyHandles(doomed);
    completePhase();
}

void ResourceLifecycle::reset() {
    std::vector<std::shared_ptr<ManagedHandle>> leftovers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        leftovers = takeAllHandlesLocked();
        user_cancelled_ = false;
        timed_out_ = false;
        phase_active_ = false;
        phase_complete_ = false;
    }
    if (!leftovers.empty()) {
        GAUGE_LOG_WARNING("lifecycle", "Reset found " + std::to_string(leftovers.size()) + " live handles");
    }
    destroyHandles(leftovers);

    // std::async futures block on destruction, so stray workers are joined here
    awaitAllWorkers();
}

bool ResourceLifecycle::waitForStop(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return state_cv_.wait_for(lock, duration, [this]() {
        return user_cancelled_ || timed_out_;
    });
}

bool ResourceLifecycle::waitForCancel(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(mutex_);
    return state_cv_.wait_for(lock, duration, [this]() { return user_cancelled_; });
}

std::vector<std::shared_ptr<ManagedHandle>> ResourceLifecycle::takeAllHandlesLocked() {
    std::vector<std::shared_ptr<ManagedHandle>> all;
    all.reserve(clients_.size() + sockets_.size() + timer_handles_.size());

    // Timers first so no ticker observes a half-destroyed phase
    all.insert(all.end(), timer_handles_.begin(), timer_handles_.end());
    all.insert(all.end(), sockets_.begin(), sockets_.end());
    all.insert(all.end(), clients_.begin(), clients_.end());

    timer_handles_.clear();
    sockets_.clear();
    clients_.clear();
    state_cv_.notify_all();
    return all;
}

void ResourceLifecycle::destroyHandles(std::vector<std::shared_ptr<ManagedHandle>>& handles) {
    for (auto& handle : handles) {
        try {
            handle->forceClose();
        } catch (const std::exception& e) {
            GAUGE_LOG_WARNING("lifecycle", std::string("Force close failed: ") + e.what());
        }
    }
    handles.clear();
}
