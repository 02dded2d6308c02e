#include "utils/Subprocess.hpp"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <system_error>
#include <thread>

#include <spawn.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace pd::utils
{

namespace
{

ProcessResult decode_status(int status)
{
    ProcessResult result;
    if (WIFEXITED(status))
    {
        result.exit_code = WEXITSTATUS(status);
    }
    else if (WIFSIGNALED(status))
    {
        result.exit_code = -1;
        result.term_signal = WTERMSIG(status);
    }
    return result;
}

} // namespace

ProcessResult run_shell_command(std::string const &command,
                                std::function<bool()> const &should_cancel,
                                std::chrono::milliseconds poll,
                                std::chrono::milliseconds kill_grace)
{
    std::string shell = "/bin/sh";
    std::string flag = "-c";
    std::string body = command;
    char *argv[] = {shell.data(), flag.data(), body.data(), nullptr};

    // The child leads its own process group so cancellation reaches the
    // commands the shell starts as well.
    posix_spawnattr_t attr;
    ::posix_spawnattr_init(&attr);
    ::posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETPGROUP);
    ::posix_spawnattr_setpgroup(&attr, 0);

    pid_t pid = 0;
    int const rc =
        ::posix_spawn(&pid, shell.c_str(), nullptr, &attr, argv, environ);
    ::posix_spawnattr_destroy(&attr);
    if (rc != 0)
    {
        throw std::system_error(rc, std::generic_category(),
                                "posix_spawn /bin/sh");
    }

    bool cancelled = false;
    bool killed = false;
    auto cancelled_at = std::chrono::steady_clock::time_point{};
    while (true)
    {
        int status = 0;
        pid_t const waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid)
        {
            auto result = decode_status(status);
            result.cancelled = cancelled;
            return result;
        }
        if (waited < 0 && errno != EINTR)
        {
            throw std::system_error(errno, std::generic_category(), "waitpid");
        }
        if (!cancelled && should_cancel && should_cancel())
        {
            cancelled = true;
            cancelled_at = std::chrono::steady_clock::now();
            ::kill(-pid, SIGTERM);
        }
        else if (cancelled && !killed &&
                 std::chrono::steady_clock::now() - cancelled_at >= kill_grace)
        {
            killed = true;
            ::kill(-pid, SIGKILL);
        }
        std::this_thread::sleep_for(poll);
    }
}

} // namespace pd::utils
