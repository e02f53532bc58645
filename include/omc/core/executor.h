#pragma once

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>

#include <algorithm>
#include <future>
#include <memory>
#include <thread>
#include <type_traits>

namespace omc::core {

/**
 * @brief Owned asio thread pool handed to components as an any_io_executor.
 *
 * Components only post leaf tasks; nothing running on the pool blocks on another pool task.
 */
class WorkerPool {
public:
    explicit WorkerPool(size_t threads = defaultThreads()) : pool_(std::max<size_t>(1, threads)) {}

    ~WorkerPool() { pool_.join(); }

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    boost::asio::any_io_executor get_executor() { return pool_.get_executor(); }

    void stop() { pool_.stop(); }

    static size_t defaultThreads() {
        auto hw = std::thread::hardware_concurrency();
        return std::clamp<size_t>(hw == 0 ? 4 : hw, 2, 16);
    }

private:
    boost::asio::thread_pool pool_;
};

/// Post `fn` to `executor` and return a future for its result.
template <typename F>
auto submit(const boost::asio::any_io_executor& executor, F&& fn)
    -> std::future<std::invoke_result_t<std::decay_t<F>>> {
    using R = std::invoke_result_t<std::decay_t<F>>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<F>(fn));
    auto fut = task->get_future();
    boost::asio::post(executor, [task]() { (*task)(); });
    return fut;
}

} // namespace omc::core
