// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "inbound_frame_queue.h"

#include "moonraker_error.h"

#include <utility>

namespace meshvault {

InboundFrameQueue::InboundFrameQueue(size_t capacity) : capacity_(capacity) {}

bool InboundFrameQueue::push(std::string frame) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return true;
        }
        if (frames_.size() >= capacity_) {
            return false;
        }
        frames_.push_back(std::move(frame));
    }
    cv_.notify_one();
    return true;
}

std::string InboundFrameQueue::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this] { return closed_ || !frames_.empty(); });

    if (!frames_.empty()) {
        std::string frame = std::move(frames_.front());
        frames_.pop_front();
        return frame;
    }
    throw TransportError(close_reason_);
}

void InboundFrameQueue::close(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            closed_ = true;
            close_reason_ = reason;
        }
    }
    cv_.notify_all();
}

bool InboundFrameQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t InboundFrameQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_.size();
}

} // namespace meshvault
