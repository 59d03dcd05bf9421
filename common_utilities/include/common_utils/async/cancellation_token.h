/**
 * @file cancellation_token.h
 * @brief 协作式取消标记
 */

#pragma once

#include "common_utils/utilities/exceptions.h"

#include <atomic>
#include <memory>
#include <string>

namespace rastercube::common_utils::async {

/**
 * @brief 可复制的取消句柄，所有副本共享同一个标志
 *
 * 调用方持有一个副本并在任意线程调用 cancel()；执行方在检查点调用
 * throwIfCancelled()。
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true, std::memory_order_release); }

    bool isCancelled() const noexcept { return flag_->load(std::memory_order_acquire); }

    /**
     * @throws OperationCancelledException 已请求取消
     */
    void throwIfCancelled(const std::string& stage) const {
        if (isCancelled()) {
            throw OperationCancelledException("Operation cancelled before " + stage);
        }
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace rastercube::common_utils::async
