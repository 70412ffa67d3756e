#include "ProcessUtils.hpp"

#include <plog/Log.h>

#include <cstdio>

#ifndef _WIN32
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#endif

namespace utils
{

bool ProcessUtils::RunProcess(const std::string& program, const std::vector<std::string>& args,
                              std::string& outOutput, int& outExitCode)
{
    outOutput.clear();
    outExitCode = -1;

    if (program.empty())
    {
        PLOG_ERROR << "RunProcess called without a program";
        return false;
    }

#ifdef _WIN32
    std::string cmdLine = "\"" + program + "\"";
    for (const auto& arg : args)
    {
        cmdLine += " \"" + arg + "\"";
    }
    cmdLine += " 2>&1";

    FILE* pipe = _popen(cmdLine.c_str(), "r");
    if (!pipe)
    {
        PLOG_ERROR << "_popen failed for: " << cmdLine;
        return false;
    }

    char buffer[4096];
    size_t n = 0;
    while ((n = fread(buffer, 1, sizeof(buffer), pipe)) > 0)
    {
        outOutput.append(buffer, n);
    }

    outExitCode = _pclose(pipe);
    PLOG_DEBUG << "Process " << program << " exited with " << outExitCode;
    return true;
#else
    int pipefd[2];
    if (pipe(pipefd) == -1)
    {
        PLOG_ERROR << "pipe() failed: " << strerror(errno);
        return false;
    }

    pid_t pid = fork();
    if (pid < 0)
    {
        PLOG_ERROR << "fork() failed: " << strerror(errno);
        close(pipefd[0]);
        close(pipefd[1]);
        return false;
    }

    if (pid == 0)
    {
        close(pipefd[0]);
        if (dup2(pipefd[1], STDOUT_FILENO) == -1 || dup2(pipefd[1], STDERR_FILENO) == -1)
        {
            _exit(127);
        }
        close(pipefd[1]);

        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(program.c_str()));
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);

        execvp(program.c_str(), argv.data());
        _exit(127);
    }

    close(pipefd[1]);

    char buffer[4096];
    for (;;)
    {
        ssize_t n = read(pipefd[0], buffer, sizeof(buffer));
        if (n > 0)
        {
            outOutput.append(buffer, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        break;
    }
    close(pipefd[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0)
    {
        if (errno != EINTR)
        {
            PLOG_ERROR << "waitpid() failed: " << strerror(errno);
            return false;
        }
    }

    if (WIFEXITED(status))
        outExitCode = WEXITSTATUS(status);
    else
        outExitCode = -1;

    if (outExitCode == 127 && outOutput.empty())
    {
        PLOG_ERROR << "Could not execute " << program;
        return false;
    }

    PLOG_DEBUG << "Process " << program << " exited with " << outExitCode;
    return true;
#endif
}

} // namespace utils
