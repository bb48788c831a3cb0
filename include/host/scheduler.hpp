#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <vector>

namespace hotswap {

// "Run callback once after at least `delay`", provided by the host.
class IScheduler {
  public:
    virtual ~IScheduler() = default;
    virtual void Schedule(std::chrono::milliseconds delay, std::function<void()> callback) = 0;
};

// One-shot timers drained by the host's own loop on its own thread.
class DeferredTaskQueue final : public IScheduler {
  public:
    using Clock = std::chrono::steady_clock;

    void Schedule(std::chrono::milliseconds delay, std::function<void()> callback) override;

    // Runs every task due at or before `now`, earliest first; tasks scheduled
    // while draining run too if they are already due. Returns how many ran.
    std::size_t RunDue(Clock::time_point now);
    // Sleeps until each pending task is due and runs it.
    std::size_t RunUntilIdle();

    std::size_t Pending() const { return tasks_.size(); }

  private:
    struct Task {
        Clock::time_point due;
        std::uint64_t seq = 0;
        std::function<void()> fn;
    };

    bool PopDue(Clock::time_point now, Task& out);

    std::vector<Task> tasks_;
    std::uint64_t next_seq_ = 0;
};

} // namespace hotswap
