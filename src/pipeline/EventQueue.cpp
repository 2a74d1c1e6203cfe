#include "ingest/pipeline/EventQueue.h"

namespace ingest {
namespace pipeline {

BoundedEventQueue::BoundedEventQueue(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity),
      closed_(false) {
}

bool BoundedEventQueue::Push(codec::Event event) {
    std::unique_lock<std::mutex> lock(mutex_);
    notFull_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
    if (closed_) return false;
    items_.push_back(std::move(event));
    notEmpty_.notify_one();
    return true;
}

bool BoundedEventQueue::Pop(codec::Event* out) {
    std::unique_lock<std::mutex> lock(mutex_);
    notEmpty_.wait(lock, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) return false;
    *out = std::move(items_.front());
    items_.pop_front();
    notFull_.notify_one();
    return true;
}

bool BoundedEventQueue::TryPop(codec::Event* out, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (!notEmpty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); })) {
        return false;
    }
    if (items_.empty()) return false;
    *out = std::move(items_.front());
    items_.pop_front();
    notFull_.notify_one();
    return true;
}

void BoundedEventQueue::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
    notEmpty_.notify_all();
    notFull_.notify_all();
}

bool BoundedEventQueue::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t BoundedEventQueue::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

} // namespace pipeline
} // namespace ingest
