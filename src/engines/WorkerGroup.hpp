#ifndef WORKER_GROUP_H
#define WORKER_GROUP_H

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

/**
 * Threads one engine phase fans out to. runDownload()/runUpload() must not
 * return before their own workers did, so every engine joins its group
 * before returning. add() is safe from timer callbacks.
 */
class WorkerGroup {
public:
    explicit WorkerGroup(std::string logGroup);
    ~WorkerGroup();

    WorkerGroup(const WorkerGroup&) = delete;
    WorkerGroup& operator=(const WorkerGroup&) = delete;

    // False once joinAll() started; the body is not run then
    bool add(std::function<void()> body);

    // Blocks until every worker, including ones added meanwhile, returned
    void joinAll();

    size_t launched() const;

private:
    std::string log_group_;
    mutable std::mutex mutex_;
    std::vector<std::unique_ptr<std::thread>> threads_;
    size_t launched_ = 0;
    bool closed_ = false;
};

#endif // WORKER_GROUP_H
