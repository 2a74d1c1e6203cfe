#include "ingest/network/WorkerPool.h"
#include "ingest/common/Logger.h"

#include <exception>

namespace ingest {
namespace network {

WorkerPool::WorkerPool(const std::string& nameArg)
    : name_(nameArg),
      started_(false),
      running_(false),
      numThreads_(1),
      busy_(0) {
}

WorkerPool::~WorkerPool() {
    Stop();
}

void WorkerPool::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) return;
    started_ = true;
    running_ = true;
    for (int i = 0; i < numThreads_; ++i) {
        threads_.emplace_back(&WorkerPool::ThreadFunc, this, i);
    }
    LOG_DEBUG << "WorkerPool " << name_ << " started with " << numThreads_ << " threads";
}

bool WorkerPool::TrySubmit(Task task) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_ || busy_ >= numThreads_) {
        return false;
    }
    ++busy_;
    pending_.push_back(std::move(task));
    cond_.notify_one();
    return true;
}

void WorkerPool::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!running_ && threads_.empty()) return;
        running_ = false;
        cond_.notify_all();
    }
    for (auto& t : threads_) {
        if (t.joinable()) t.join();
    }
    threads_.clear();
    LOG_DEBUG << "WorkerPool " << name_ << " stopped";
}

int WorkerPool::busy() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_;
}

void WorkerPool::ThreadFunc(int index) {
    while (true) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this] { return !pending_.empty() || !running_; });
            // Drain what was already admitted before honouring Stop().
            if (pending_.empty()) return;
            task = std::move(pending_.front());
            pending_.pop_front();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR << "WorkerPool " << name_ << index << " task threw: " << e.what();
        }

        std::lock_guard<std::mutex> lock(mutex_);
        --busy_;
    }
}

} // namespace network
} // namespace ingest
