#pragma once

#include "ingest/common/noncopyable.h"

#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace ingest {
namespace network {

// Fixed set of worker threads with exactly one slot per thread. A slot is taken
// when a task is submitted and given back when the task returns, so at most
// numThreads tasks are ever submitted-but-unfinished.
class WorkerPool : ingest::common::noncopyable {
public:
    using Task = std::function<void()>;

    explicit WorkerPool(const std::string& nameArg);
    ~WorkerPool();

    void SetThreadNum(int numThreads) { numThreads_ = numThreads; }
    void Start();

    // Never blocks. False when every slot is taken or the pool is not running.
    bool TrySubmit(Task task);

    // Lets submitted tasks finish, then joins the threads.
    void Stop();

    int busy() const;
    bool started() const { return started_; }
    const std::string& name() const { return name_; }

private:
    void ThreadFunc(int index);

    std::string name_;
    bool started_;
    bool running_;
    int numThreads_;
    int busy_;
    std::deque<Task> pending_;
    std::vector<std::thread> threads_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
};

} // namespace network
} // namespace ingest
