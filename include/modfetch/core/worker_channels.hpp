// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <modfetch/core/chunk.hpp>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>
#include <system_error>
#include <variant>
#include <vector>

namespace modfetch::core {

// Bytes read by a worker for one chunk, starting at absolute offset
struct ChunkData {
    Chunk chunk;
    std::uint64_t offset{0};
    std::vector<std::byte> bytes;
};

// Posted after the last ChunkData of a chunk that finished cleanly
struct ChunkCompleted {
    Chunk chunk;
};

// Posted instead of ChunkCompleted; carries the original, unmodified range
struct ChunkFailure {
    Chunk chunk;
    std::error_code error;
};

using WorkerMessage = std::variant<ChunkData, ChunkCompleted, ChunkFailure>;

// Data and error channels between many workers and one consumer.
// Both queues share one wait so the consumer blocks on either without
// polling. Data messages (ChunkData, ChunkCompleted) are served before
// failures, so a chunk's bytes are always drained ahead of its failure.
class WorkerChannels {
public:
    WorkerChannels() = default;

    WorkerChannels(const WorkerChannels&) = delete;
    WorkerChannels& operator=(const WorkerChannels&) = delete;

    // Producers. Return false once the channels are closed.
    [[nodiscard]] bool send_data(ChunkData data);
    [[nodiscard]] bool send_completed(Chunk chunk);
    [[nodiscard]] bool send_failure(ChunkFailure failure);

    // Block until a message arrives. Empty when stop is requested, or when
    // the channels are closed and nothing is left to read.
    [[nodiscard]] std::optional<WorkerMessage> receive(std::stop_token stop);

    // Non-blocking variant of receive()
    [[nodiscard]] std::optional<WorkerMessage> try_receive();

    // Consumer hang-up; further sends fail
    void close() noexcept;
    [[nodiscard]] bool closed() const noexcept;

    [[nodiscard]] std::size_t pending() const noexcept;

private:
    [[nodiscard]] std::optional<WorkerMessage> pop_locked();

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<std::variant<ChunkData, ChunkCompleted>> data_;
    std::deque<ChunkFailure> errors_;
    bool closed_{false};
};

} // namespace modfetch::core
