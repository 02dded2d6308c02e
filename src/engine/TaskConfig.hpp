#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace pd::engine
{

// The unit of work a task performs. The scheduler only ever calls execute();
// a thrown exception marks the run as failed, a normal return as succeeded.
class WorkUnit
{
  public:
    virtual ~WorkUnit() = default;
    virtual void execute() = 0;
};

// Adapts a plain callable to WorkUnit.
class FunctionWork final : public WorkUnit
{
  public:
    explicit FunctionWork(std::function<void()> fn) : fn_(std::move(fn)) {}

    void execute() override
    {
        if (fn_)
        {
            fn_();
        }
    }

  private:
    std::function<void()> fn_;
};

using WorkUnitPtr = std::shared_ptr<WorkUnit>;

inline WorkUnitPtr make_work(std::function<void()> fn)
{
    return std::make_shared<FunctionWork>(std::move(fn));
}

// Longest execution or timeout interval a task may be configured with.
inline constexpr std::chrono::milliseconds kMaxInterval{
    std::chrono::hours(24 * 365)};

struct TaskDefaults
{
    std::chrono::milliseconds execution_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds timeout_interval{std::chrono::seconds(10)};
    bool active = false;
    bool run_immediately_on_start = true;
    bool consistent_start_time = false;
};

// Call-site options; every set field wins over defaults and environment.
struct TaskOptions
{
    std::optional<std::chrono::milliseconds> execution_interval;
    std::optional<std::chrono::milliseconds> timeout_interval;
    std::optional<bool> active;
    std::optional<bool> run_immediately_on_start;
    std::optional<bool> consistent_start_time;
};

struct TaskConfig
{
    std::string name;
    std::string description;
    WorkUnitPtr work;
    std::chrono::milliseconds execution_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds timeout_interval{std::chrono::seconds(10)};
    bool active = false;
    bool run_immediately_on_start = true;
    bool consistent_start_time = false;
};

} // namespace pd::engine
