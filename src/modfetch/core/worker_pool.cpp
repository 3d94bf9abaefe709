// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/core/worker_pool.hpp>

namespace modfetch::core {

WorkerPool::WorkerPool(std::size_t workers) {
    if (workers == 0) workers = 1;
    threads_.reserve(workers);
    for (std::size_t i = 0; i < workers; ++i) {
        threads_.emplace_back([this](std::stop_token stoken) { run(stoken); });
    }
}

WorkerPool::~WorkerPool() {
    for (auto& thread : threads_) {
        thread.request_stop();
    }
    {
        std::lock_guard lock(mutex_);
        tasks_.clear();
    }
    cv_.notify_all();
    threads_.clear();  // joins
}

void WorkerPool::submit(Task task) {
    {
        std::lock_guard lock(mutex_);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
}

std::size_t WorkerPool::queued() const {
    std::lock_guard lock(mutex_);
    return tasks_.size();
}

void WorkerPool::run(std::stop_token stoken) {
    while (!stoken.stop_requested()) {
        Task task;
        {
            std::unique_lock lock(mutex_);
            if (!cv_.wait(lock, stoken, [this] { return !tasks_.empty(); })) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task(stoken);
    }
}

} // namespace modfetch::core
