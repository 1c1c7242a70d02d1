#include "timer_service.h"
#include "gauge_logger.h"

#include <asio/post.hpp>
#include <algorithm>

ManagedTimer::ManagedTimer(Key, asio::io_context& ioc, std::chrono::milliseconds interval,
                           bool periodic, Callback callback)
    : ioc_(ioc),
      timer_(ioc),
      interval_(interval),
      periodic_(periodic),
      callback_(std::move(callback)) {
}

void ManagedTimer::cancel() {
    if (cancelled_.exchange(true)) {
        return;
    }
    // steady_timer is only touched on the io thread
    auto self = shared_from_this();
    asio::post(ioc_, [self]() {
        self->timer_.cancel();
    });
}

void ManagedTimer::arm() {
    if (cancelled_.load()) {
        return;
    }
    timer_.expires_after(interval_);
    auto self = shared_from_this();
    timer_.async_wait([self](const std::error_code& ec) {
        self->onExpired(ec);
    });
}

void ManagedTimer::onExpired(const std::error_code& ec) {
    if (ec == asio::error::operation_aborted || cancelled_.load()) {
        return;
    }

    fire_count_.fetch_add(1);
    try {
        if (callback_) {
            callback_();
        }
    } catch (const std::exception& e) {
        GAUGE_LOG_ERROR("timer", std::string("Timer callback failed: ") + e.what());
    }

    if (periodic_) {
        arm();
    } else {
        cancelled_.store(true);
    }
}

TimerService::TimerService()
    : work_(asio::make_work_guard(ioc_)) {
    thread_ = std::thread([this]() {
        ioc_.run();
    });
}

TimerService::~TimerService() {
    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        for (auto& weak : timers_) {
            if (auto timer = weak.lock()) {
                timer->cancel();
            }
        }
        timers_.clear();
    }
    // run() returns once every cancelled wait has been delivered
    work_.reset();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::shared_ptr<ManagedTimer> TimerService::createOneShot(std::chrono::milliseconds delay,
                                                          ManagedTimer::Callback callback) {
    return create(delay, false, std::move(callback));
}

std::shared_ptr<ManagedTimer> TimerService::createPeriodic(std::chrono::milliseconds interval,
                                                           ManagedTimer::Callback callback) {
    return create(interval, true, std::move(callback));
}

std::shared_ptr<ManagedTimer> TimerService::create(std::chrono::milliseconds interval, bool periodic,
                                                   ManagedTimer::Callback callback) {
    auto timer = std::make_shared<ManagedTimer>(ManagedTimer::Key{}, ioc_, interval, periodic,
                                                std::move(callback));

    {
        std::lock_guard<std::mutex> lock(timers_mutex_);
        timers_.erase(std::remove_if(timers_.begin(), timers_.end(),
                                     [](const std::weak_ptr<ManagedTimer>& w) { return w.expired(); }),
                      timers_.end());
        timers_.push_back(timer);
    }

    asio::post(ioc_, [timer]() {
        timer->arm();
    });
    return timer;
}
