// Copyright (c) 2026 changcheng967. All rights reserved.

#include <modfetch/core/worker_channels.hpp>

namespace modfetch::core {

bool WorkerChannels::send_data(ChunkData data) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return false;
        data_.emplace_back(std::move(data));
    }
    cv_.notify_one();
    return true;
}

bool WorkerChannels::send_completed(Chunk chunk) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return false;
        data_.emplace_back(ChunkCompleted{chunk});
    }
    cv_.notify_one();
    return true;
}

bool WorkerChannels::send_failure(ChunkFailure failure) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) return false;
        errors_.push_back(std::move(failure));
    }
    cv_.notify_one();
    return true;
}

std::optional<WorkerMessage> WorkerChannels::receive(std::stop_token stop) {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, stop, [this] {
        return closed_ || !data_.empty() || !errors_.empty();
    });
    if (stop.stop_requested()) {
        return std::nullopt;
    }
    return pop_locked();
}

std::optional<WorkerMessage> WorkerChannels::try_receive() {
    std::lock_guard lock(mutex_);
    return pop_locked();
}

void WorkerChannels::close() noexcept {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool WorkerChannels::closed() const noexcept {
    std::lock_guard lock(mutex_);
    return closed_;
}

std::size_t WorkerChannels::pending() const noexcept {
    std::lock_guard lock(mutex_);
    return data_.size() + errors_.size();
}

std::optional<WorkerMessage> WorkerChannels::pop_locked() {
    if (!data_.empty()) {
        auto front = std::move(data_.front());
        data_.pop_front();
        return std::visit([](auto&& msg) -> WorkerMessage { return std::move(msg); }, std::move(front));
    }
    if (!errors_.empty()) {
        auto failure = std::move(errors_.front());
        errors_.pop_front();
        return failure;
    }
    return std::nullopt;
}

} // namespace modfetch::core
