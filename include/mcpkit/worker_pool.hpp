#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>

namespace mcpkit {

/// Pool running queued tasks in FIFO order.
///
/// It keeps `threads` core workers and adds another whenever a task is queued
/// with no idle worker left to take it, so a task that never returns holds
/// only its own thread. Workers above the core count exit after
/// `idle_timeout` without work. Workers own the pool state they use, which
/// lets a bounded stop() leave a stuck task behind.
class WorkerPool {
public:
    explicit WorkerPool(size_t threads,
                        std::chrono::milliseconds idle_timeout = std::chrono::seconds(30));
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /// No-op while running. After a stop() the pool can be started again.
    void start();

    /// Stop accepting tasks, run what is already queued and wait for every
    /// worker to exit.
    void stop();

    /// As stop(), but wait at most `grace`. Workers still busy afterwards
    /// finish their task and exit on their own. Returns true if every
    /// worker exited in time.
    bool stop(std::chrono::milliseconds grace);

    /// Returns false while the pool is not running.
    bool submit(std::function<void()> task);

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] size_t size() const { return core_threads_; }

    /// Workers currently alive, core and extra.
    [[nodiscard]] size_t live_workers() const;

private:
    struct State;

    static void spawn(const std::shared_ptr<State>& state, bool core);
    static void worker_loop(const std::shared_ptr<State>& state, bool core);

    size_t core_threads_;
    std::chrono::milliseconds idle_timeout_;

    mutable std::mutex state_mutex_;
    std::shared_ptr<State> state_;
};

} // namespace mcpkit
