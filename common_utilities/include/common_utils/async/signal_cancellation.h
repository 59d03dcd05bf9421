/**
 * @file signal_cancellation.h
 * @brief 把 SIGINT/SIGTERM 转换为取消请求
 */

#pragma once

#include "common_utils/async/cancellation_token.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <thread>

namespace rastercube::common_utils::async {

/**
 * @brief 作用域内监听 SIGINT 和 SIGTERM，收到信号时取消 token
 *
 * 后台线程运行一个只处理信号的 io_context。析构时停止并等待该线程，
 * 包括异常展开期间。
 */
class ScopedSignalCancellation {
public:
    explicit ScopedSignalCancellation(CancellationToken token);
    ~ScopedSignalCancellation();

    ScopedSignalCancellation(const ScopedSignalCancellation&) = delete;
    ScopedSignalCancellation& operator=(const ScopedSignalCancellation&) = delete;

    /// 已收到的信号编号，未收到时为 0
    int caughtSignal() const noexcept { return caughtSignal_.load(); }

private:
    CancellationToken token_;
    boost::asio::io_context ioContext_;
    boost::asio::signal_set signals_;
    std::atomic<int> caughtSignal_{0};
    std::thread worker_;
};

} // namespace rastercube::common_utils::async
