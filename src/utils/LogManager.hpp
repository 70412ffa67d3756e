#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// Owns the plog appenders of the process. Levels and append mode come from the
// [logging] section, which the caller has already parsed.
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        bool append = true;
        plog::Severity level = plog::info;
        std::size_t max_file_size = 5 * 1024 * 1024;
        int backup_count = 3;
        bool mirror_to_console = false;
    };

    // Creates the log directory. Returns false when it cannot be created.
    static bool Initialize(const std::string& logDir = "logs");

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    template<int InstanceId = 0>
    static void SetLevel(plog::Severity level);

    static void Shutdown();

    static const std::string& GetLogDirectory();

    // Clamps a configured integer level onto plog's range (0 = none .. 6 = verbose)
    static plog::Severity SeverityFromLevel(int level);

private:
    LogManager() = default;

    static bool s_initialized;
    static std::string s_log_dir;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
