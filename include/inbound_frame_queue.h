// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>

namespace meshvault {

/**
 * @brief Bounded hand-off of received text frames to a single reader
 *
 * Filled from the socket's event-loop thread, drained by receive(). Once
 * closed, frames already queued are still handed out; after that pop()
 * reports the close reason.
 */
class InboundFrameQueue {
  public:
    explicit InboundFrameQueue(size_t capacity);

    InboundFrameQueue(const InboundFrameQueue&) = delete;
    InboundFrameQueue& operator=(const InboundFrameQueue&) = delete;

    /**
     * @brief Queue one frame
     *
     * Frames pushed after close() are dropped.
     *
     * @return false if the queue is full (the frame is not queued)
     */
    bool push(std::string frame);

    /**
     * @brief Block until a frame is available
     *
     * @throws TransportError with the close reason once closed and drained
     */
    std::string pop();

    /// @brief Close with @p reason and wake pop(); the first reason is kept
    void close(const std::string& reason);

    bool is_closed() const;
    size_t size() const;

    size_t capacity() const {
        return capacity_;
    }

  private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> frames_;
    bool closed_ = false;
    std::string close_reason_;
};

} // namespace meshvault
