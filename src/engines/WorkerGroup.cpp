#include "WorkerGroup.hpp"
#include "gauge_logger.h"

WorkerGroup::WorkerGroup(std::string logGroup)
    : log_group_(std::move(logGroup)) {
}

WorkerGroup::~WorkerGroup() {
    joinAll();
}

bool WorkerGroup::add(std::function<void()> body) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return false;
    }

    std::string group = log_group_;
    threads_.push_back(std::make_unique<std::thread>([body = std::move(body), group]() {
        try {
            body();
        } catch (const std::exception& e) {
            GAUGE_LOG(group, std::string("Worker ended with: ") + e.what());
        }
    }));
    ++launched_;
    return true;
}

void WorkerGroup::joinAll() {
    for (;;) {
        std::vector<std::unique_ptr<std::thread>> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending.swap(threads_);
            if (pending.empty()) {
                closed_ = true;
                return;
            }
        }
        for (auto& thread : pending) {
            if (thread->joinable()) {
                thread->join();
            }
        }
    }
}

size_t WorkerGroup::launched() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return launched_;
}
