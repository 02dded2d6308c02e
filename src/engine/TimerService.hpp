#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <unordered_set>
#include <vector>

namespace pd::engine
{

// Single-shot timers served by one background thread. Callbacks run on the
// timer thread and must return quickly; hand real work to a WorkerPool.
class TimerService
{
  public:
    using Clock = std::chrono::steady_clock;
    using TimerId = std::uint64_t;
    using Callback = std::function<void()>;

    TimerService() = default;
    TimerService(TimerService const &) = delete;
    TimerService &operator=(TimerService const &) = delete;
    ~TimerService();

    void start();
    // Joins the timer thread. Timers still pending are discarded.
    void stop();

    // Returns 0 when the service has been stopped.
    TimerId schedule_at(Clock::time_point due, Callback callback);
    TimerId schedule_after(std::chrono::milliseconds delay, Callback callback);

    // True if the timer was still pending and will now never fire.
    bool cancel(TimerId id);

    std::size_t pending() const;

  private:
    struct Timer
    {
        TimerId id;
        Clock::time_point due;
        Callback callback;

        // Min-heap on due time; ties fire in scheduling order.
        bool operator>(Timer const &other) const
        {
            if (due != other.due)
                return due > other.due;
            return id > other.id;
        }
    };

    void loop();

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::priority_queue<Timer, std::vector<Timer>, std::greater<Timer>> timers_;
    std::unordered_set<TimerId> live_;
    TimerId next_id_ = 1;
    bool stopping_ = false;
    std::thread thread_;
};

} // namespace pd::engine
