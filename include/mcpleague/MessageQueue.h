//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: MessageQueue.h
// Purpose: Bounded, thread-safe three-tier priority queue used for outbound dispatch and inbound routing
//==========================================================================================================

#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "mcpleague/JSONRPCTypes.h"

namespace mcpleague {

// Fixed dispatch tiers. Heartbeats always use URGENT so an application backlog cannot starve them.
enum class Priority {
    Urgent = 0,
    High = 1,
    Normal = 2
};

constexpr std::size_t kPriorityTierCount = 3;

const char* PriorityToString(Priority p);

enum class MessageDirection {
    Outbound,
    Inbound
};

//==========================================================================================================
// QueuedMessage
// Purpose: Unit of work in the queue.
// Fields:
//   id: Monotonic id assigned by Enqueue.
//   correlationId: Pending request key for outbound calls; empty for notifications.
//   deadline: When set, the item is skipped (and counted as expired) once the deadline has passed.
//==========================================================================================================
struct QueuedMessage {
    uint64_t id{0};
    Priority priority{Priority::Normal};
    MessageDirection direction{MessageDirection::Outbound};
    std::string correlationId;
    std::string method;
    JSONValue payload;
    std::chrono::steady_clock::time_point enqueuedAt{};
    std::optional<std::chrono::steady_clock::time_point> deadline;
};

struct MessageQueueStats {
    std::size_t size{0};
    std::size_t maxSize{0};
    uint64_t totalEnqueued{0};
    uint64_t totalDequeued{0};
    uint64_t totalDropped{0};
    uint64_t totalExpired{0};
    std::array<std::size_t, kPriorityTierCount> byPriority{};
};

//==========================================================================================================
// PriorityMessageQueue
// Purpose: Dequeue returns the oldest entry of the highest non-empty tier: every URGENT before any HIGH,
//          every HIGH before any NORMAL, FIFO within a tier.
//==========================================================================================================
class PriorityMessageQueue {
public:
    explicit PriorityMessageQueue(std::size_t maxSize = 1000);
    ~PriorityMessageQueue();

    PriorityMessageQueue(const PriorityMessageQueue&) = delete;
    PriorityMessageQueue& operator=(const PriorityMessageQueue&) = delete;

    //==========================================================================================================
    // Enqueue
    // Purpose: Appends the message to its priority tier.
    // Args:
    //   message: Message to store; id and enqueuedAt are assigned here.
    //   priority: Target tier (overrides message.priority).
    // Returns:
    //   Assigned message id. Throws errors::QueueFullError when full or closed.
    //==========================================================================================================
    uint64_t Enqueue(QueuedMessage message, Priority priority);

    //==========================================================================================================
    // Dequeue
    // Purpose: Blocks up to timeout for the next message. Expired entries are discarded on the way.
    // Returns:
    //   The message, or std::nullopt on timeout or once closed and drained.
    //==========================================================================================================
    std::optional<QueuedMessage> Dequeue(std::chrono::milliseconds timeout);

    // Copy of the message Dequeue would return next, without removing it.
    std::optional<QueuedMessage> Peek() const;

    std::size_t Size() const;
    bool Empty() const;

    // Removes every queued message; returns how many were removed.
    std::size_t Clear();

    // Wakes all waiters; later Enqueue calls fail with QueueFullError.
    void Close();
    bool IsClosed() const;

    MessageQueueStats GetStats() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpleague
