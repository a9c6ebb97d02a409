//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageQueue.cpp
// Purpose: Priority message queue implementation
//==========================================================================================================

#include <array>
#include <condition_variable>
#include <deque>
#include <mutex>

#include "logging/Logger.h"
#include "mcpleague/MessageQueue.h"
#include "mcpleague/errors/Errors.h"

namespace mcpleague {

const char* PriorityToString(Priority p) {
    switch (p) {
        case Priority::Urgent: return "URGENT";
        case Priority::High: return "HIGH";
        case Priority::Normal: return "NORMAL";
    }
    return "NORMAL";
}

class PriorityMessageQueue::Impl {
public:
    explicit Impl(std::size_t maxSize) : maxSize(maxSize) {}

    std::size_t maxSize;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::array<std::deque<QueuedMessage>, kPriorityTierCount> tiers;
    bool closed{false};
    uint64_t nextId{1};
    uint64_t totalEnqueued{0};
    uint64_t totalDequeued{0};
    uint64_t totalDropped{0};
    uint64_t totalExpired{0};

    std::size_t sizeLocked() const {
        std::size_t n = 0;
        for (const auto& t : tiers) {
            n += t.size();
        }
        return n;
    }

    // Pops the next live message, discarding expired ones. Caller holds the lock.
    std::optional<QueuedMessage> popLocked() {
        const auto now = std::chrono::steady_clock::now();
        for (auto& tier : tiers) {
            while (!tier.empty()) {
                QueuedMessage msg = std::move(tier.front());
                tier.pop_front();
                if (msg.deadline.has_value() && *msg.deadline <= now) {
                    ++totalExpired;
                    LOG_DEBUG("Queue: dropping expired message {} ({})", msg.id, msg.method);
                    continue;
                }
                ++totalDequeued;
                return msg;
            }
        }
        return std::nullopt;
    }
};

PriorityMessageQueue::PriorityMessageQueue(std::size_t maxSize)
    : pImpl(std::make_unique<Impl>(maxSize)) {
    FUNC_SCOPE();
}

PriorityMessageQueue::~PriorityMessageQueue() {
    FUNC_SCOPE();
    Close();
}

uint64_t PriorityMessageQueue::Enqueue(QueuedMessage message, Priority priority) {
    FUNC_SCOPE();
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        if (pImpl->closed) {
            ++pImpl->totalDropped;
            throw errors::QueueFullError("Queue is closed");
        }
        if (pImpl->sizeLocked() >= pImpl->maxSize) {
            ++pImpl->totalDropped;
            throw errors::QueueFullError("Queue is full (" + std::to_string(pImpl->maxSize) + " messages)");
        }
        id = pImpl->nextId++;
        message.id = id;
        message.priority = priority;
        message.enqueuedAt = std::chrono::steady_clock::now();
        pImpl->tiers[static_cast<std::size_t>(priority)].push_back(std::move(message));
        ++pImpl->totalEnqueued;
    }
    pImpl->cv.notify_one();
    return id;
}

std::optional<QueuedMessage> PriorityMessageQueue::Dequeue(std::chrono::milliseconds timeout) {
    FUNC_SCOPE();
    const auto until = std::chrono::steady_clock::now() + timeout;
    std::unique_lock<std::mutex> lock(pImpl->mutex);
    while (true) {
        if (auto msg = pImpl->popLocked()) {
            return msg;
        }
        if (pImpl->closed) {
            return std::nullopt;
        }
        if (pImpl->cv.wait_until(lock, until) == std::cv_status::timeout) {
            return pImpl->popLocked();
        }
    }
}

std::optional<QueuedMessage> PriorityMessageQueue::Peek() const {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    for (const auto& tier : pImpl->tiers) {
        if (!tier.empty()) {
            return tier.front();
        }
    }
    return std::nullopt;
}

std::size_t PriorityMessageQueue::Size() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->sizeLocked();
}

bool PriorityMessageQueue::Empty() const {
    return Size() == 0;
}

std::size_t PriorityMessageQueue::Clear() {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    const std::size_t removed = pImpl->sizeLocked();
    for (auto& tier : pImpl->tiers) {
        tier.clear();
    }
    return removed;
}

void PriorityMessageQueue::Close() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->closed = true;
    }
    pImpl->cv.notify_all();
}

bool PriorityMessageQueue::IsClosed() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    return pImpl->closed;
}

MessageQueueStats PriorityMessageQueue::GetStats() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    MessageQueueStats stats;
    stats.size = pImpl->sizeLocked();
    stats.maxSize = pImpl->maxSize;
    stats.totalEnqueued = pImpl->totalEnqueued;
    stats.totalDequeued = pImpl->totalDequeued;
    stats.totalDropped = pImpl->totalDropped;
    stats.totalExpired = pImpl->totalExpired;
    for (std::size_t i = 0; i < kPriorityTierCount; ++i) {
        stats.byPriority[i] = pImpl->tiers[i].size();
    }
    return stats;
}

} // namespace mcpleague
