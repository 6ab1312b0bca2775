/**
 * Single-threaded background context
 *
 * One long-lived thread draining a FIFO task queue, one task at a time.
 * The parse and tokenize stages each own one so a request never blocks the
 * caller and requests of the same kind never overlap.
 */

#pragma once

#include <condition_variable>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <type_traits>

namespace promptmap {

class BackgroundWorker {
public:
    using Task = std::function<void()>;

    explicit BackgroundWorker(std::string name)
        : name_(std::move(name))
        , thread_(&BackgroundWorker::worker_loop, this) {}

    // Runs every task still queued, then joins
    ~BackgroundWorker() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stop_ = true;
        }
        work_cv_.notify_all();
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    BackgroundWorker(const BackgroundWorker&) = delete;
    BackgroundWorker& operator=(const BackgroundWorker&) = delete;
    BackgroundWorker(BackgroundWorker&&) = delete;
    BackgroundWorker& operator=(BackgroundWorker&&) = delete;

    // Queue a task; an exception it throws is stored in the returned future
    template<typename F>
    auto submit(F&& f) -> std::future<std::invoke_result_t<F>> {
        using ReturnType = std::invoke_result_t<F>;

        auto task = std::make_shared<std::packaged_task<ReturnType()>>(std::forward<F>(f));
        std::future<ReturnType> result = task->get_future();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.emplace_back([task]() { (*task)(); });
        }
        work_cv_.notify_one();
        return result;
    }

    // Block until the queue is empty and no task is running
    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return queue_.empty() && !busy_; });
    }

    size_t pending() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size() + (busy_ ? 1 : 0);
    }

    const std::string& name() const noexcept { return name_; }

private:
    void worker_loop() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (true) {
            work_cv_.wait(lock, [this] { return stop_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;  // stopping and drained
            }

            Task task = std::move(queue_.front());
            queue_.pop_front();
            busy_ = true;

            lock.unlock();
            task();
            lock.lock();

            busy_ = false;
            if (queue_.empty()) {
                idle_cv_.notify_all();
            }
        }
    }

    std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    std::deque<Task> queue_;
    bool stop_ = false;
    bool busy_ = false;
    std::thread thread_;  // last: started once everything above exists
};

} // namespace promptmap
