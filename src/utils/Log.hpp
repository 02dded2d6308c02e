#pragma once

#include <chrono>
#include <cstdio>
#include <ctime>
#include <exception>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <utility>

namespace pd::log
{

// Route log lines to a file in addition to stderr. An empty path disables
// the file sink.
void set_log_file(std::filesystem::path const &path);

// Defined in Log.cpp; a no-op while no log file is configured.
void append_log_line_to_file(std::string const &line);

// PD_ENABLE_LOGGING, when defined and non-zero, wins over PD_BUILD_MINIMAL.
#if (defined(PD_ENABLE_LOGGING) && (PD_ENABLE_LOGGING)) ||                     \
    !defined(PD_BUILD_MINIMAL)
template <typename... Args>
inline void write_line(char level, std::string_view fmt, Args &&...args)
{
    const auto now = std::chrono::system_clock::now();
    auto const millis = static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch())
            .count() %
        1000);
    auto const time = std::chrono::system_clock::to_time_t(now);
    std::tm tm{};
    localtime_r(&time, &tm);
    char time_buffer[16]{};
    std::strftime(time_buffer, sizeof(time_buffer), "%H:%M:%S", &tm);

    auto const message = std::vformat(fmt, std::make_format_args(args...));
    char millis_buf[8] = {};
    std::snprintf(millis_buf, sizeof(millis_buf), "%03lld", millis);
    std::string final;
    final.reserve(64 + message.size());
    final.push_back('[');
    final.push_back(level);
    final.push_back(' ');
    final.append(time_buffer);
    final.push_back('.');
    final.append(millis_buf);
    final.append("] ");
    final.append(message);
    if (stderr)
    {
        std::fprintf(stderr, "%s\n", final.c_str());
        std::fflush(stderr);
    }
    try
    {
        append_log_line_to_file(final);
    }
    catch (std::exception const &ex)
    {
        std::fprintf(stderr, "log file append failed: %s\n", ex.what());
    }
}
#else
template <typename... Args>
inline void write_line(char, std::string_view, Args &&...) noexcept
{
}
#endif

template <typename... Args>
inline void print_status(std::string_view fmt, Args &&...args)
{
    auto const message = std::vformat(fmt, std::make_format_args(args...));
    std::fputs(message.c_str(), stdout);
    std::fputc('\n', stdout);
}

} // namespace pd::log

#define PD_LOG_INFO(fmt, ...) pd::log::write_line('I', fmt, ##__VA_ARGS__)
#define PD_LOG_DEBUG(fmt, ...) pd::log::write_line('D', fmt, ##__VA_ARGS__)
#define PD_LOG_WARN(fmt, ...) pd::log::write_line('W', fmt, ##__VA_ARGS__)
#define PD_LOG_ERROR(fmt, ...) pd::log::write_line('E', fmt, ##__VA_ARGS__)
