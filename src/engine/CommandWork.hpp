#pragma once

#include "engine/TaskConfig.hpp"

#include <string>

namespace pd::engine
{

// Work unit that runs a shell command. A non-zero exit status, or death by
// signal, raises CommandFailedError. The child is sent SIGTERM when the run
// is cancelled by its timeout.
class CommandWork final : public WorkUnit
{
  public:
    explicit CommandWork(std::string command);

    void execute() override;

    std::string const &command() const noexcept { return command_; }

  private:
    std::string command_;
};

} // namespace pd::engine
