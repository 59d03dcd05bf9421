/**
 * @file task_pool.h
 * @brief 有界工作线程池 (boost::asio::thread_pool + boost::future)
 *
 * 一次装配运行创建一个 TaskPool，运行结束时析构并等待所有任务完成，
 * 不留下任何后台线程。线程数 <= 1 时进入单线程模式，任务在提交线程内
 * 直接执行。
 */

#pragma once

#define RASTERCUBE_ENABLE_BOOST_ASIO
#include "../utilities/boost_config.h"

#include <boost/asio/thread_pool.hpp>
#include <boost/asio/post.hpp>
#include <boost/thread/future.hpp>
#include <boost/exception_ptr.hpp>

#include <atomic>
#include <cstddef>
#include <exception>
#include <memory>
#include <type_traits>
#include <utility>

namespace rastercube::common_utils::infrastructure {

class TaskPool {
public:
    enum class RunMode {
        SINGLE_THREAD,   // 提交线程内同步执行
        THREAD_POOL      // 工作线程执行
    };

    /**
     * @param threadCount 工作线程数；0 或 1 表示单线程模式
     */
    explicit TaskPool(size_t threadCount);
    ~TaskPool();

    TaskPool(const TaskPool&) = delete;
    TaskPool& operator=(const TaskPool&) = delete;

    /**
     * @brief 提交任务，异常通过 future 传播给调用方
     */
    template<typename Func>
    auto submitTask(Func&& func) -> boost::future<std::invoke_result_t<Func>>;

    /**
     * @brief 等待所有已提交任务完成，之后提交的任务在调用线程内执行
     */
    void shutdown();

    RunMode runMode() const { return runMode_; }

    size_t threadCount() const { return threadCount_; }

    size_t completedTasks() const { return completedTasks_.load(); }

private:
    template<typename ResultType, typename Func>
    static void runInto(boost::promise<ResultType>& promise, Func& func);

    RunMode runMode_;
    size_t threadCount_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
    std::atomic<size_t> completedTasks_{0};
};

// === 模板实现 ===

template<typename ResultType, typename Func>
void TaskPool::runInto(boost::promise<ResultType>& promise, Func& func) {
    try {
        if constexpr (std::is_void_v<ResultType>) {
            func();
            promise.set_value();
        } else {
            promise.set_value(func());
        }
    } catch (...) {
        // get() 时按原始异常类型重新抛出
        promise.set_exception(boost::current_exception());
    }
}

template<typename Func>
auto TaskPool::submitTask(Func&& func) -> boost::future<std::invoke_result_t<Func>> {
    using ResultType = std::invoke_result_t<Func>;

    auto promise = std::make_shared<boost::promise<ResultType>>();
    auto future = promise->get_future();

    if (runMode_ == RunMode::SINGLE_THREAD || !pool_) {
        runInto(*promise, func);
        completedTasks_.fetch_add(1);
        return future;
    }

    boost::asio::post(*pool_, [this, promise, func = std::forward<Func>(func)]() mutable {
        runInto(*promise, func);
        completedTasks_.fetch_add(1);
    });

    return future;
}

} // namespace rastercube::common_utils::infrastructure
