/**
 * @file signal_cancellation.cpp
 * @brief 信号取消作用域实现
 */

#include "common_utils/async/signal_cancellation.h"
#include "common_utils/utilities/logging_utils.h"

#include <csignal>
#include <utility>

namespace rastercube::common_utils::async {

ScopedSignalCancellation::ScopedSignalCancellation(CancellationToken token)
    : token_(std::move(token)), signals_(ioContext_, SIGINT, SIGTERM) {
    signals_.async_wait([this](const boost::system::error_code& error, int signum) {
        if (!error) {
            LOG_WARN("Caught signal {}, requesting cancellation", signum);
            caughtSignal_.store(signum);
            token_.cancel();
        }
    });
    worker_ = std::thread([this]() { ioContext_.run(); });
}

ScopedSignalCancellation::~ScopedSignalCancellation() {
    ioContext_.stop();
    if (worker_.joinable()) {
        worker_.join();
    }
}

} // namespace rastercube::common_utils::async
