#pragma once
// ═══════════════════════════════════════════════════════════════════
//  gqlpp/task_queue.h — FIFO of reactions waiting to run
// ═══════════════════════════════════════════════════════════════════
//  There is no event loop. Settled futures push their reactions here
//  and SyncAdapter::wait pops them one at a time, oldest first.
//  One queue belongs to exactly one adapter.
// ═══════════════════════════════════════════════════════════════════

#include <cstddef>
#include <deque>
#include <functional>

namespace gqlpp::promise {

class TaskQueue {
public:
    using Task = std::function<void()>;

    TaskQueue() = default;
    TaskQueue(const TaskQueue&) = delete;
    TaskQueue& operator=(const TaskQueue&) = delete;

    void enqueue(Task task) {
        tasks_.push_back(std::move(task));
    }

    // ── Pop and run the oldest task; false when there was none ──
    bool runNext() {
        if (tasks_.empty()) return false;
        Task task = std::move(tasks_.front());
        tasks_.pop_front();
        ++processed_;
        task();
        return true;
    }

    bool empty() const { return tasks_.empty(); }
    std::size_t size() const { return tasks_.size(); }

    // Number of tasks run since construction.
    std::size_t processed() const { return processed_; }

private:
    std::deque<Task> tasks_;
    std::size_t processed_ = 0;
};

} // namespace gqlpp::promise
