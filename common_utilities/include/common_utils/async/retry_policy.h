/**
 * @file retry_policy.h
 * @brief 指数退避重试策略与执行器
 */

#pragma once

#include "common_utils/async/cancellation_token.h"
#include "common_utils/utilities/exceptions.h"
#include "common_utils/utilities/logging_utils.h"

#include <chrono>
#include <cstddef>
#include <exception>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace rastercube::common_utils::async {

/**
 * @brief 重试策略
 *
 * 第 k 次失败后的等待时间为 initialDelay * multiplier^(k-1)。
 */
struct RetryPolicy {
    size_t maxAttempts = 5;                            // 最大尝试次数（含首次）
    std::chrono::milliseconds initialDelay{1000};      // 首次等待时间
    double multiplier = 2.0;                           // 退避乘数
    std::chrono::milliseconds maxDelay{0};             // 最大等待时间，0 表示不限制
    bool enableJitter = false;                         // 启用 ±25% 抖动

    /**
     * @brief 计算第 retryCount 次重试前的等待时间
     * @param retryCount 从 1 开始；0 返回 0
     */
    std::chrono::milliseconds calculateDelay(size_t retryCount) const;

    /// @throws ValidationException maxAttempts 为 0 或乘数小于 1
    void validate() const;

    std::string toString() const;
};

/**
 * @brief 重试执行器
 *
 * 对分类器判定为可重试的异常按策略等待后重试；最后一次失败或不可重试的
 * 异常原样重新抛出。每次尝试前检查取消标记。
 */
class RetryExecutor {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    using RetryClassifier = std::function<bool(const std::exception&)>;

    explicit RetryExecutor(RetryPolicy policy,
                           Sleeper sleeper = defaultSleeper(),
                           RetryClassifier classifier = defaultClassifier());

    /**
     * @brief 使用 boost::this_thread::sleep_for 阻塞当前线程
     */
    static Sleeper defaultSleeper();

    /**
     * @brief 只重试 IOException
     */
    static RetryClassifier defaultClassifier();

    void setCancellationToken(std::optional<CancellationToken> token) { cancellation_ = std::move(token); }

    const RetryPolicy& policy() const { return policy_; }

    template<typename Func>
    auto execute(Func&& operation, const std::string& description) const -> decltype(operation()) {
        for (size_t attempt = 1;; ++attempt) {
            if (cancellation_) {
                cancellation_->throwIfCancelled(description);
            }
            try {
                return operation();
            } catch (const std::exception& e) {
                if (attempt >= policy_.maxAttempts || !classifier_(e)) {
                    throw;
                }
                auto delay = policy_.calculateDelay(attempt);
                LOG_WARN("{} failed (attempt {}/{}): {}. Retrying in {} ms",
                         description, attempt, policy_.maxAttempts, e.what(), delay.count());
                sleeper_(delay);
            }
        }
    }

private:
    RetryPolicy policy_;
    Sleeper sleeper_;
    RetryClassifier classifier_;
    std::optional<CancellationToken> cancellation_;
};

} // namespace rastercube::common_utils::async
