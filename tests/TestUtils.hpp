#pragma once

#include "engine/FailureObserver.hpp"
#include "engine/ResourceScope.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace pd::tests
{

using namespace std::chrono_literals;

// Polls `predicate` until it holds or `timeout` elapses.
inline bool wait_until(std::function<bool()> const &predicate,
                       std::chrono::milliseconds timeout = 2000ms)
{
    auto const deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
        {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

class RecordingTracker final : public engine::ErrorTracker
{
  public:
    void notify(engine::FailureReport const &report) override
    {
        std::lock_guard<std::mutex> guard(mutex_);
        reports_.push_back(report);
    }

    std::vector<engine::FailureReport> reports() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        return reports_;
    }

    std::size_t count() const
    {
        std::lock_guard<std::mutex> guard(mutex_);
        return reports_.size();
    }

  private:
    mutable std::mutex mutex_;
    std::vector<engine::FailureReport> reports_;
};

class CountingScope final : public engine::ResourceScope
{
  public:
    void acquire() override { acquired.fetch_add(1); }
    void release() noexcept override { released.fetch_add(1); }

    std::atomic<int> acquired{0};
    std::atomic<int> released{0};
};

inline std::filesystem::path make_temp_root(std::string_view tag)
{
    auto root = std::filesystem::temp_directory_path() / "periodical-test" / tag;
    std::error_code ec;
    std::filesystem::remove_all(root, ec);
    std::filesystem::create_directories(root, ec);
    return root;
}

} // namespace pd::tests
