#include "engine/FailureObserver.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <cstdio>
#include <ctime>
#include <exception>
#include <utility>

namespace pd::engine
{

namespace
{

std::string format_utc(std::chrono::system_clock::time_point time)
{
    auto const seconds = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
    gmtime_r(&seconds, &tm);
    char buffer[32]{};
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buffer;
}

} // namespace

std::string FailureReport::to_json() const
{
    pd::json::MutableDocument doc;
    auto *native = doc.doc();
    if (native == nullptr)
    {
        return "{}";
    }
    auto *root = yyjson_mut_obj(native);
    doc.set_root(root);
    yyjson_mut_obj_add_strcpy(native, root, "task", task.c_str());
    if (time)
    {
        yyjson_mut_obj_add_strcpy(native, root, "time",
                                  format_utc(*time).c_str());
    }
    else
    {
        yyjson_mut_obj_add_null(native, root, "time");
    }
    yyjson_mut_obj_add_str(native, root, "kind", to_string(status));
    yyjson_mut_obj_add_strcpy(native, root, "message", message.c_str());
    auto *frames = yyjson_mut_arr(native);
    for (auto const &frame : backtrace)
    {
        yyjson_mut_arr_add_strcpy(native, frames, frame.c_str());
    }
    yyjson_mut_obj_add_val(native, root, "backtrace", frames);
    return doc.write();
}

FailureObserver::FailureObserver(std::string task_name,
                                 std::shared_ptr<ErrorTracker> tracker)
    : task_name_(std::move(task_name)), tracker_(std::move(tracker))
{
}

void FailureObserver::report(
    std::optional<std::chrono::system_clock::time_point> time,
    RunOutcome const &outcome) const noexcept
{
    if (outcome.ok())
    {
        return;
    }
    // Reporting is best effort: nothing raised here may reach the runner.
    try
    {
        FailureReport report;
        report.task = task_name_;
        report.time = time;
        report.status = outcome.status;
        report.message = outcome.message;
        report.backtrace = outcome.backtrace;

        PD_LOG_ERROR("({}) {} failed with error {}",
                     time ? format_utc(*time) : std::string("manual"),
                     task_name_, outcome.message);
        PD_LOG_ERROR("{}", report.to_json());

        if (tracker_)
        {
            tracker_->notify(report);
        }
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "failure report for %s dropped: %s\n",
                     task_name_.c_str(), ex.what());
    }
    catch (...)
    {
        std::fprintf(stderr, "failure report for %s dropped\n",
                     task_name_.c_str());
    }
}

} // namespace pd::engine
