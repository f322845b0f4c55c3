#include "mcpkit/worker_pool.hpp"
#include "mcpkit/logging.hpp"
#include <exception>
#include <system_error>
#include <thread>

namespace mcpkit {

struct WorkerPool::State {
    std::mutex mutex;
    std::condition_variable work_cv;
    std::condition_variable done_cv;
    std::queue<std::function<void()>> tasks;
    std::chrono::milliseconds idle_timeout{0};
    bool running{true};
    size_t idle{0};  // workers waiting for a task
    size_t live{0};
};

namespace {

void run_task(const std::function<void()>& task) {
    try {
        task();
    } catch (const std::exception& e) {
        logging::logger()->error("Worker task failed: {}", e.what());
    } catch (...) {
        logging::logger()->error("Worker task failed with a non-standard exception");
    }
}

} // anonymous namespace

WorkerPool::WorkerPool(size_t threads, std::chrono::milliseconds idle_timeout)
    : core_threads_(threads == 0 ? 1 : threads), idle_timeout_(idle_timeout) {}

WorkerPool::~WorkerPool() {
    if (is_running()) stop();
}

void WorkerPool::start() {
    std::lock_guard<std::mutex> guard(state_mutex_);
    if (state_) {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->running) return;
    }
    auto state = std::make_shared<State>();
    state->idle_timeout = idle_timeout_;
    state_ = state;
    for (size_t i = 0; i < core_threads_; ++i) {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            ++state->live;
        }
        spawn(state, true);
    }
}

void WorkerPool::spawn(const std::shared_ptr<State>& state, bool core) {
    try {
        std::thread([state, core] { worker_loop(state, core); }).detach();
    } catch (const std::system_error& e) {
        logging::logger()->error("Could not start a worker thread: {}", e.what());
        std::lock_guard<std::mutex> lock(state->mutex);
        --state->live;
        state->done_cv.notify_all();
    }
}

void WorkerPool::stop() {
    std::shared_ptr<State> state;
    {
        std::lock_guard<std::mutex> guard(state_mutex_);
        state = state_;
    }
    if (!state) return;

    std::unique_lock<std::mutex> lock(state->mutex);
    state->running = false;
    state->work_cv.notify_all();
    state->done_cv.wait(lock, [&] { return state->live == 0; });
}

bool WorkerPool::stop(std::chrono::milliseconds grace) {
    std::shared_ptr<State> state;
    {
        std::lock_guard<std::mutex> guard(state_mutex_);
        state = state_;
    }
    if (!state) return true;

    std::unique_lock<std::mutex> lock(state->mutex);
    state->running = false;
    state->work_cv.notify_all();
    if (state->done_cv.wait_for(lock, grace, [&] { return state->live == 0; })) return true;

    logging::logger()->warn("{} worker(s) still busy after {} ms; leaving them behind",
                            state->live - state->idle, grace.count());
    return false;
}

bool WorkerPool::submit(std::function<void()> task) {
    std::shared_ptr<State> state;
    {
        std::lock_guard<std::mutex> guard(state_mutex_);
        state = state_;
    }
    if (!state) return false;

    bool grow = false;
    {
        std::lock_guard<std::mutex> lock(state->mutex);
        if (!state->running) return false;
        state->tasks.push(std::move(task));
        // Every queued task needs a worker of its own that is not busy.
        if (state->tasks.size() > state->idle) {
            ++state->live;
            grow = true;
        }
    }
    state->work_cv.notify_one();
    if (grow) spawn(state, false);
    return true;
}

bool WorkerPool::is_running() const {
    std::lock_guard<std::mutex> guard(state_mutex_);
    if (!state_) return false;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->running;
}

size_t WorkerPool::live_workers() const {
    std::lock_guard<std::mutex> guard(state_mutex_);
    if (!state_) return 0;
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->live;
}

void WorkerPool::worker_loop(const std::shared_ptr<State>& state, bool core) {
    std::unique_lock<std::mutex> lock(state->mutex);
    while (true) {
        ++state->idle;
        bool woken = state->work_cv.wait_for(lock, state->idle_timeout, [&] {
            return !state->tasks.empty() || !state->running;
        });
        --state->idle;

        if (state->tasks.empty()) {
            if (!state->running) break;
            if (!woken && !core) break;
            continue;
        }

        {
            auto task = std::move(state->tasks.front());
            state->tasks.pop();
            lock.unlock();
            run_task(task);
        }
        lock.lock();
    }
    --state->live;
    state->done_cv.notify_all();
}

} // namespace mcpkit
