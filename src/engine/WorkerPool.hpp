#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace pd::engine
{

// Fixed set of threads draining a FIFO of jobs. stop() lets queued jobs
// finish before joining.
class WorkerPool
{
  public:
    explicit WorkerPool(std::size_t threads);
    WorkerPool(WorkerPool const &) = delete;
    WorkerPool &operator=(WorkerPool const &) = delete;
    ~WorkerPool();

    void start();
    void stop();
    bool is_running() const noexcept;

    // Returns false when the pool is stopping and the job was dropped.
    bool submit(std::function<void()> job);

    std::size_t thread_count() const noexcept { return thread_count_; }

  private:
    void loop();

    std::size_t const thread_count_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::function<void()>> jobs_;
    std::vector<std::thread> workers_;
    std::atomic<bool> running_{false};
    std::atomic<bool> exit_requested_{false};
};

} // namespace pd::engine
