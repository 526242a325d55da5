#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <utility>

// Hands work from capture/worker threads back to the daemon thread.
// post() may be called from any thread; run_pending() only from the owner.
class TaskQueue {
public:
    using Task = std::move_only_function<void()>;
    using NotifyCallback = std::function<void()>;

    explicit TaskQueue(NotifyCallback notify = {}) : notify_(std::move(notify)) {}

    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    void post(Task task) {
        {
            std::lock_guard lock(mu_);
            tasks_.push_back(std::move(task));
        }
        if (notify_) notify_();
    }

    // Runs every task queued before the call. Tasks posted while running are
    // left for the next call. Returns the number of tasks run.
    size_t run_pending() {
        std::deque<Task> batch;
        {
            std::lock_guard lock(mu_);
            batch.swap(tasks_);
        }
        for (auto& task : batch) {
            task();
        }
        return batch.size();
    }

    bool empty() const {
        std::lock_guard lock(mu_);
        return tasks_.empty();
    }

private:
    NotifyCallback notify_;
    mutable std::mutex mu_;
    std::deque<Task> tasks_;
};
