#pragma once

#include <string>
#include <vector>

namespace utils
{

// Cross-platform utilities for child processes
class ProcessUtils
{
public:
    // Runs a program found on PATH and waits for it.
    // stdout and stderr are captured together into outOutput.
    // Returns false when the process could not be started at all.
    static bool RunProcess(const std::string& program, const std::vector<std::string>& args, std::string& outOutput,
                           int& outExitCode);
};

} // namespace utils
