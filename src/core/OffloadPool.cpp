#include "core/OffloadPool.h"

#include "core/Logger.h"

namespace psmonitor {

OffloadPool::OffloadPool(std::size_t threads)
    : size_(threads == 0 ? 1 : threads),
      pool_(size_) {
    PSM_LOG_DEBUG("[OffloadPool] started with " << size_ << " threads");
}

OffloadPool::~OffloadPool() {
    stop();
}

void OffloadPool::stop() {
    if (stopped_.exchange(true)) return;
    pool_.join();
    PSM_LOG_DEBUG("[OffloadPool] stopped");
}

} // namespace psmonitor
