#pragma once

#include <chrono>
#include <stdexcept>
#include <string>

namespace pd::engine
{

// Malformed PERIODICAL entry or task definition file. Fatal at startup.
class ConfigError : public std::runtime_error
{
  public:
    using std::runtime_error::runtime_error;
};

// Lookup of a task name that was never registered.
class UnknownTaskError : public std::runtime_error
{
  public:
    explicit UnknownTaskError(std::string const &name)
        : std::runtime_error("unknown periodical task: " + name), name_(name)
    {
    }

    std::string const &name() const noexcept { return name_; }

  private:
    std::string name_;
};

class TaskTimeoutError : public std::runtime_error
{
  public:
    TaskTimeoutError(std::string const &name,
                     std::chrono::milliseconds timeout)
        : std::runtime_error("task " + name + " timed out after " +
                             std::to_string(timeout.count()) + "ms"),
          timeout_(timeout)
    {
    }

    std::chrono::milliseconds timeout() const noexcept { return timeout_; }

  private:
    std::chrono::milliseconds timeout_;
};

class CommandFailedError : public std::runtime_error
{
  public:
    CommandFailedError(std::string const &message, int exit_code)
        : std::runtime_error(message), exit_code_(exit_code)
    {
    }

    int exit_code() const noexcept { return exit_code_; }

  private:
    int exit_code_;
};

} // namespace pd::engine
