#ifndef TIMER_SERVICE_H
#define TIMER_SERVICE_H

#ifndef ASIO_STANDALONE
#define ASIO_STANDALONE
#endif

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/steady_timer.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "managed_handle.h"

class TimerService;

// One-shot or periodic timer driven by the TimerService thread.
class ManagedTimer : public ManagedHandle, public std::enable_shared_from_this<ManagedTimer> {
    struct Key {
        explicit Key() = default;
    };

public:
    using Callback = std::function<void()>;

    // Only TimerService can build the key
    ManagedTimer(Key, asio::io_context& ioc, std::chrono::milliseconds interval,
                 bool periodic, Callback callback);
    ~ManagedTimer() override = default;

    // Safe from any thread, including from inside the timer's own callback.
    void cancel();
    bool isCancelled() const { return cancelled_.load(); }
    int fireCount() const { return fire_count_.load(); }

    void forceClose() override { cancel(); }

private:
    friend class TimerService;

    void arm();
    void onExpired(const std::error_code& ec);

    asio::io_context& ioc_;
    asio::steady_timer timer_;
    std::chrono::milliseconds interval_;
    bool periodic_;
    Callback callback_;
    std::atomic<bool> cancelled_{false};
    std::atomic<int> fire_count_{0};
};

/**
 * Owns one asio io_context and the thread that runs it. All kill timers, UI
 * tickers, ramp timers and request watchdogs of a run share it.
 */
class TimerService {
public:
    TimerService();
    ~TimerService();

    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;

    std::shared_ptr<ManagedTimer> createOneShot(std::chrono::milliseconds delay,
                                                ManagedTimer::Callback callback);
    std::shared_ptr<ManagedTimer> createPeriodic(std::chrono::milliseconds interval,
                                                 ManagedTimer::Callback callback);

private:
    std::shared_ptr<ManagedTimer> create(std::chrono::milliseconds interval, bool periodic,
                                         ManagedTimer::Callback callback);

    asio::io_context ioc_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    std::thread thread_;

    std::mutex timers_mutex_;
    std::vector<std::weak_ptr<ManagedTimer>> timers_;
};

#endif // TIMER_SERVICE_H
