#pragma once

#include "util/result.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace driverfetch {

class IProcessRunner {
  public:
    virtual ~IProcessRunner() = default;

    // Runs argv[0] (a path) with stdio on /dev/null. Ok() means the child
    // ran to completion; its status lands in exit_code. Fails with ETIMEDOUT
    // after `timeout` (child killed), kErrCancelled on interrupt (child
    // killed), or the exec errno when the program could not be started.
    virtual Result Run(const std::vector<std::string>& argv,
                       std::chrono::seconds timeout,
                       int& exit_code) const = 0;
};

class PosixProcessRunner final : public IProcessRunner {
  public:
    Result Run(const std::vector<std::string>& argv,
               std::chrono::seconds timeout,
               int& exit_code) const override;

    static std::shared_ptr<const IProcessRunner> Default();
};

std::string JoinCommandLine(const std::vector<std::string>& argv);

} // namespace driverfetch
