#include "ingest/pipeline/AdmissionController.h"
#include "ingest/network/Connection.h"
#include "ingest/network/WorkerPool.h"
#include "ingest/common/Logger.h"

namespace ingest {
namespace pipeline {

AdmissionController::AdmissionController(network::WorkerPool* pool, const ServeCallback& serve)
    : pool_(pool),
      serve_(serve),
      accepted_(0),
      rejected_(0) {
}

AdmissionController::Decision AdmissionController::Admit(const std::shared_ptr<network::Connection>& conn) {
    ServeCallback serve = serve_;
    if (pool_->TrySubmit([serve, conn]() { serve(conn); })) {
        ++accepted_;
        return kAccepted;
    }
    ++rejected_;
    LOG_DEBUG << "no free worker slot, rejecting " << conn->peerAddress().toIpPort()
              << " busy=" << pool_->busy();
    return kRejected;
}

} // namespace pipeline
} // namespace ingest
