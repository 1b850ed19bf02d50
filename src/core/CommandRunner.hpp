#pragma once
#include <mirror-launcher/Types.hpp>
#include <string>
#include <vector>

namespace mirror_launcher {

// Runs an external program to completion. Implementations must be callable
// from any thread.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    virtual CommandResult run(const std::string& program,
                              const std::vector<std::string>& arguments,
                              int timeoutMs) = 0;
};

class ProcessRunner : public CommandRunner {
public:
    CommandResult run(const std::string& program,
                      const std::vector<std::string>& arguments,
                      int timeoutMs) override;
};

std::string toolStatusName(ToolStatus status);

}
