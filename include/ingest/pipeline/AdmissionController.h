#pragma once

#include "ingest/common/noncopyable.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

namespace ingest {
namespace network {
class Connection;
class WorkerPool;
}

namespace pipeline {

// Hands a connection to a free worker slot or refuses it on the spot. Never
// waits for a slot; a worker blocked on a full queue keeps its slot busy, so a
// saturated queue shows up here as rejections.
class AdmissionController : ingest::common::noncopyable {
public:
    enum Decision {
        kAccepted,
        kRejected,
    };

    using ServeCallback = std::function<void(const std::shared_ptr<network::Connection>&)>;

    AdmissionController(network::WorkerPool* pool, const ServeCallback& serve);

    // Accept thread only. On kRejected the connection is untouched and still
    // owned by the caller, which answers it with 429.
    Decision Admit(const std::shared_ptr<network::Connection>& conn);

    uint64_t accepted() const { return accepted_; }
    uint64_t rejected() const { return rejected_; }

private:
    network::WorkerPool* pool_;
    ServeCallback serve_;
    std::atomic<uint64_t> accepted_;
    std::atomic<uint64_t> rejected_;
};

} // namespace pipeline
} // namespace ingest
