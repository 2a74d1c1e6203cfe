#pragma once

#include "ingest/codec/Event.h"
#include "ingest/common/noncopyable.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace ingest {
namespace pipeline {

// Downstream sink for decoded events.
class EventQueue : ingest::common::noncopyable {
public:
    virtual ~EventQueue() = default;

    // Blocks while the queue is full. Never drops: returns false only when the
    // queue was closed, in which case the event was not taken.
    virtual bool Push(codec::Event event) = 0;
};

// Multi-producer, multi-consumer FIFO with fixed capacity.
class BoundedEventQueue : public EventQueue {
public:
    explicit BoundedEventQueue(size_t capacity);

    bool Push(codec::Event event) override;

    // Blocks until an event is available; false once closed and empty.
    bool Pop(codec::Event* out);
    bool TryPop(codec::Event* out, std::chrono::milliseconds timeout);

    // Wakes every waiter. Pending events can still be popped.
    void Close();
    bool closed() const;

    size_t Size() const;
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    bool closed_;
    std::deque<codec::Event> items_;
    mutable std::mutex mutex_;
    std::condition_variable notEmpty_;
    std::condition_variable notFull_;
};

} // namespace pipeline
} // namespace ingest
