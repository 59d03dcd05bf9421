/**
 * @file task_pool.cpp
 * @brief 有界工作线程池实现
 */

#include "common_utils/infrastructure/task_pool.h"
#include "common_utils/utilities/logging_utils.h"

namespace rastercube::common_utils::infrastructure {

TaskPool::TaskPool(size_t threadCount)
    : runMode_(threadCount <= 1 ? RunMode::SINGLE_THREAD : RunMode::THREAD_POOL),
      threadCount_(threadCount <= 1 ? 1 : threadCount) {
    if (runMode_ == RunMode::THREAD_POOL) {
        pool_ = std::make_unique<boost::asio::thread_pool>(threadCount_);
    }
    LOG_DEBUG("TaskPool created: {} thread(s), {}",
              threadCount_, runMode_ == RunMode::SINGLE_THREAD ? "inline" : "pooled");
}

TaskPool::~TaskPool() {
    shutdown();
}

void TaskPool::shutdown() {
    if (pool_) {
        pool_->join();
        pool_.reset();
        LOG_DEBUG("TaskPool shut down after {} task(s)", completedTasks_.load());
    }
}

} // namespace rastercube::common_utils::infrastructure
