#ifndef RESOURCE_LIFECYCLE_H
#define RESOURCE_LIFECYCLE_H

#include <chrono>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <vector>

#include "managed_handle.h"
#include "timer_service.h"

/**
 * Registry of every live client, socket, timer and worker of one test run, and
 * the single source of truth for "should this test stop now".
 *
 * Contracts:
 *   1. Register at birth. A handle registered after shouldStop() turned true
 *      is force-closed on the spot instead of being tracked.
 *   2. Await at death. Every launched worker is awaited before a phase result
 *      is read.
 *   3. Cancel is total. cancel()/timeoutPhase() force-close everything that
 *      is tracked in one sweep; no graceful shutdown.
 *
 * One instance per Orchestrator, reset() at the start of every run.
 */
class ResourceLifecycle {
public:
    using WorkerBody = std::function<void()>;

    explicit ResourceLifecycle(TimerService& timers);
    ~ResourceLifecycle();

    ResourceLifecycle(const ResourceLifecycle&) = delete;
    ResourceLifecycle& operator=(const ResourceLifecycle&) = delete;

    // Flags
    bool isUserCancelled() const;
    bool isTimedOut() const;
    bool shouldStop() const;

    // Registration; each returns false when the handle was destroyed instead of tracked
    bool registerClient(const std::shared_ptr<ManagedHandle>& client);
    bool registerSocket(const std::shared_ptr<ManagedHandle>& socket);
    bool registerTimer(const std::shared_ptr<ManagedHandle>& timer);

    // Normal-completion path: the owner closed the handle itself
    void releaseClient(const std::shared_ptr<ManagedHandle>& client);
    void releaseSocket(const std::shared_ptr<ManagedHandle>& socket);
    void releaseTimer(const std::shared_ptr<ManagedHandle>& timer);

    size_t trackedHandleCount() const;

    // Workers
    void launchWorker(WorkerBody body);
    void awaitAllWorkers();

    // Phase gate
    void beginPhase();
    void completePhase();
    void awaitPhaseComplete();

    // Teardown
    void timeoutPhase();
    void cancel();
    void reset();

    // Sleeps for up to `duration`; returns true if the run was stopped meanwhile
    bool waitForStop(std::chrono::milliseconds duration);

    // Same, but only user cancellation cuts the wait short
    bool waitForCancel(std::chrono::milliseconds duration);

    TimerService& timers() { return timers_; }

private:
    bool registerHandle(std::vector<std::shared_ptr<ManagedHandle>>& registry,
                        const std::shared_ptr<ManagedHandle>& handle);
    void releaseHandle(std::vector<std::shared_ptr<ManagedHandle>>& registry,
                       const std::shared_ptr<ManagedHandle>& handle);

    // Caller holds mutex_; returns everything that must be force-closed
    std::vector<std::shared_ptr<ManagedHandle>> takeAllHandlesLocked();
    static void destroyHandles(std::vector<std::shared_ptr<ManagedHandle>>& handles);

    void completePhaseLocked();

    TimerService& timers_;

    mutable std::mutex mutex_;
    std::condition_variable state_cv_;

    bool user_cancelled_ = false;
    bool timed_out_ = false;

    std::vector<std::shared_ptr<ManagedHandle>> clients_;
    std::vector<std::shared_ptr<ManagedHandle>> sockets_;
    std::vector<std::shared_ptr<ManagedHandle>> timer_handles_;

    std::mutex workers_mutex_;
    std::vector<std::future<void>> workers_;

    bool phase_active_ = false;
    bool phase_complete_ = false;
};

#endif // RESOURCE_LIFECYCLE_H
