#include "host/scheduler.hpp"

#include <algorithm>
#include <thread>

namespace hotswap {

void DeferredTaskQueue::Schedule(std::chrono::milliseconds delay, std::function<void()> callback) {
    if (!callback)
        return;
    tasks_.push_back(Task{
        .due = Clock::now() + std::max(delay, std::chrono::milliseconds::zero()),
        .seq = next_seq_++,
        .fn = std::move(callback),
    });
}

bool DeferredTaskQueue::PopDue(Clock::time_point now, Task& out) {
    auto it = std::min_element(tasks_.begin(), tasks_.end(), [](const Task& a, const Task& b) {
        return a.due != b.due ? a.due < b.due : a.seq < b.seq;
    });
    if (it == tasks_.end() || it->due > now)
        return false;
    out = std::move(*it);
    tasks_.erase(it);
    return true;
}

std::size_t DeferredTaskQueue::RunDue(Clock::time_point now) {
    std::size_t ran = 0;
    Task task;
    while (PopDue(now, task)) {
        task.fn();
        ++ran;
    }
    return ran;
}

std::size_t DeferredTaskQueue::RunUntilIdle() {
    std::size_t ran = 0;
    while (!tasks_.empty()) {
        const auto next = std::min_element(tasks_.begin(), tasks_.end(), [](const Task& a, const Task& b) {
                              return a.due < b.due;
                          })->due;
        std::this_thread::sleep_until(next);
        ran += RunDue(Clock::now());
    }
    return ran;
}

} // namespace hotswap
