#include "utils/Shutdown.hpp"

#include <atomic>
#include <csignal>
#include <thread>

namespace pd::runtime
{

namespace
{
std::atomic_bool g_shutdown_requested{false};

void on_terminate_signal(int)
{
    request_shutdown();
}
} // namespace

void request_shutdown() noexcept
{
    g_shutdown_requested.store(true, std::memory_order_relaxed);
}

bool should_shutdown() noexcept
{
    return g_shutdown_requested.load(std::memory_order_relaxed);
}

void wait_for_shutdown(std::chrono::milliseconds poll)
{
    while (!should_shutdown())
    {
        std::this_thread::sleep_for(poll);
    }
}

void install_signal_handlers()
{
    std::signal(SIGINT, on_terminate_signal);
    std::signal(SIGTERM, on_terminate_signal);
}

} // namespace pd::runtime
