#include "common_utils/async/retry_policy.h"
#include "common_utils/utilities/boost_config.h"

#include <boost/thread/thread.hpp>
#include <boost/chrono.hpp>

#include <algorithm>
#include <cmath>
#include <random>
#include <sstream>

namespace rastercube::common_utils::async {

// === RetryPolicy 实现 ===

std::chrono::milliseconds RetryPolicy::calculateDelay(size_t retryCount) const {
    if (retryCount == 0) return std::chrono::milliseconds{0};

    auto delay = static_cast<double>(initialDelay.count()) *
                 std::pow(multiplier, static_cast<double>(retryCount - 1));

    auto result = std::chrono::milliseconds{static_cast<long long>(delay)};
    if (maxDelay.count() > 0) {
        result = std::min(result, maxDelay);
    }

    if (enableJitter) {
        static thread_local std::random_device rd;
        static thread_local std::mt19937 gen(rd());
        std::uniform_real_distribution<> dis(0.75, 1.25);
        result = std::chrono::milliseconds{
            static_cast<long long>(static_cast<double>(result.count()) * dis(gen))
        };
    }

    return result;
}

void RetryPolicy::validate() const {
    if (maxAttempts == 0) {
        throw ValidationException("retry.max_attempts must be at least 1");
    }
    if (multiplier < 1.0) {
        throw ValidationException("retry.multiplier must be >= 1.0");
    }
    if (initialDelay.count() < 0) {
        throw ValidationException("retry.initial_delay_ms must not be negative");
    }
}

std::string RetryPolicy::toString() const {
    std::ostringstream oss;
    oss << "RetryPolicy[MaxAttempts:" << maxAttempts
        << " InitialDelay:" << initialDelay.count() << "ms"
        << " Multiplier:" << multiplier
        << " MaxDelay:" << maxDelay.count() << "ms"
        << " Jitter:" << (enableJitter ? "Yes" : "No") << "]";
    return oss.str();
}

// === RetryExecutor 实现 ===

RetryExecutor::RetryExecutor(RetryPolicy policy, Sleeper sleeper, RetryClassifier classifier)
    : policy_(policy), sleeper_(std::move(sleeper)), classifier_(std::move(classifier)) {
    policy_.validate();
    if (!sleeper_) {
        sleeper_ = defaultSleeper();
    }
    if (!classifier_) {
        classifier_ = defaultClassifier();
    }
}

RetryExecutor::Sleeper RetryExecutor::defaultSleeper() {
    return [](std::chrono::milliseconds delay) {
        boost::this_thread::sleep_for(boost::chrono::milliseconds(delay.count()));
    };
}

RetryExecutor::RetryClassifier RetryExecutor::defaultClassifier() {
    return [](const std::exception& e) {
        return dynamic_cast<const IOException*>(&e) != nullptr;
    };
}

} // namespace rastercube::common_utils::async
