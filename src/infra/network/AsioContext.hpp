#pragma once

#include <asio.hpp>
#include <atomic>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <vector>

namespace camlink::infra {

/**
 * @brief Worker pool running discovery, detection and reconnection work.
 *
 * Wraps an asio::io_context kept alive by an executor_work_guard and driven
 * by a fixed number of threads. Timers of the reconnection layer and the
 * asynchronous connects of the port scanner run on the same context.
 *
 * Workers are named "<name>-<index>" for debuggers and top. A handler that
 * throws is logged and counted; its worker goes back to the queue.
 *
 * @note Non-copyable. Owned by the Application and passed by reference.
 */
class AsioContext {
public:
    /**
     * @brief Constructs an AsioContext with the specified number of threads.
     * @param threadCount Number of worker threads (at least one).
     * @param name Thread name prefix, cut to fit the 15 character kernel limit.
     */
    explicit AsioContext(size_t threadCount = std::thread::hardware_concurrency(),
                         std::string name = "camlink-io");

    /**
     * @brief Destructor. Stops the context and joins all threads.
     */
    ~AsioContext();

    AsioContext(const AsioContext&) = delete;
    AsioContext& operator=(const AsioContext&) = delete;

    /**
     * @brief Creates the work guard and spawns the worker threads.
     *
     * Has no effect if already running.
     */
    void start();

    /**
     * @brief Releases the work guard, stops the context and joins the workers.
     */
    void stop();

    [[nodiscard]] bool isRunning() const { return running_.load(); }
    [[nodiscard]] size_t threadCount() const { return threadCount_; }
    [[nodiscard]] const std::string& name() const { return name_; }

    /// Handlers that escaped with an exception since construction.
    [[nodiscard]] size_t handlerFailures() const { return handlerFailures_.load(); }

    asio::io_context& getContext() { return ioContext_; }

    /**
     * @brief Posts a handler to the worker pool.
     * @tparam Handler Callable type.
     * @param handler The handler to execute.
     */
    template <typename Handler>
    void post(Handler&& handler) {
        asio::post(ioContext_, std::forward<Handler>(handler));
    }

    /**
     * @brief Runs a callable on the worker pool and exposes its result as a future.
     *
     * Exceptions thrown by the callable are delivered through the future.
     *
     * @tparam Func Callable type.
     * @param func Callable to run.
     * @return Future of the callable's result.
     */
    template <typename Func>
    auto submit(Func&& func) -> std::future<std::invoke_result_t<std::decay_t<Func>>> {
        using Result = std::invoke_result_t<std::decay_t<Func>>;
        auto promise = std::make_shared<std::promise<Result>>();
        auto future = promise->get_future();

        post([promise, fn = std::forward<Func>(func)]() mutable {
            try {
                if constexpr (std::is_void_v<Result>) {
                    fn();
                    promise->set_value();
                } else {
                    promise->set_value(fn());
                }
            } catch (...) {
                promise->set_exception(std::current_exception());
            }
        });

        return future;
    }

private:
    using WorkGuard = asio::executor_work_guard<asio::io_context::executor_type>;

    void runWorker(size_t index);

    asio::io_context ioContext_;
    std::optional<WorkGuard> workGuard_;
    std::vector<std::thread> threads_;
    std::atomic<bool> running_{false};
    std::atomic<size_t> handlerFailures_{0};
    size_t threadCount_;
    std::string name_;
};

} // namespace camlink::infra
