// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace modfetch::core {

// Fixed set of long-lived threads pulling tasks from one unbounded queue.
// At most size() tasks run at once; the rest wait in submission order.
class WorkerPool {
public:
    using Task = std::function<void(std::stop_token)>;

    explicit WorkerPool(std::size_t workers);

    // Requests stop, drops queued tasks and joins. Running tasks see
    // their stop token tripped and are expected to return promptly.
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;
    WorkerPool(WorkerPool&&) = delete;
    WorkerPool& operator=(WorkerPool&&) = delete;

    void submit(Task task);

    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }
    [[nodiscard]] std::size_t queued() const;

private:
    void run(std::stop_token stoken);

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Task> tasks_;
    std::vector<std::jthread> threads_;  // last: joined before the queue dies
};

} // namespace modfetch::core
