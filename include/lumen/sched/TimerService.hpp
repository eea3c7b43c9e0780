#pragma once

#include <asio.hpp>

#include <memory>
#include <thread>

namespace lumen::sched {

/**
 * @brief Centralises the Asio aliases so higher-level code never names ::asio directly.
 */
namespace asio = ::asio;

/**
 * @brief RAII wrapper around `asio::io_context` with a dedicated worker thread.
 *
 * The controller uses it to run deferred work (auto-stop timers) off the
 * caller's thread. All handlers are serialised on the single worker.
 *
 * Lifetime notes:
 * - Timers created on `context()` must be destroyed before the service.
 * - `shutdown()` releases the work guard, stops the context and joins the
 *   worker. Pending handlers that have not started never run. It is safe to
 *   call more than once, and the destructor calls it.
 * - Do not call `shutdown()` from a handler running on the worker.
 */
class TimerService {
public:
    TimerService();
    ~TimerService();

    TimerService(const TimerService&) = delete;
    TimerService& operator=(const TimerService&) = delete;
    TimerService(TimerService&&) = delete;
    TimerService& operator=(TimerService&&) = delete;

    asio::io_context& context() { return *io_; }

    void shutdown();

private:
    std::shared_ptr<asio::io_context> io_;
    asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
    std::thread t_;
};

} // namespace lumen::sched
