#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
std::string LogManager::s_log_dir = "logs";
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const std::string& logDir)
{
    if (s_initialized)
        return true;

    s_log_dir = logDir;
    std::error_code ec;
    std::filesystem::create_directories(s_log_dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to create log directory",
                                     s_log_dir + ": " + ec.message());
        return false;
    }

    s_initialized = true;
    return true;
}

template<int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Logging used before initialization", config.name);
        return false;
    }

    try
    {
        if (!config.append)
            std::ofstream(config.filepath, std::ios::trunc).close();

        auto file = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);
        plog::init<InstanceId>(config.level, file.get());
        s_appenders.push_back(std::move(file));

        if (config.mirror_to_console)
        {
            auto console = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            plog::get<InstanceId>()->addAppender(console.get());
            s_appenders.push_back(std::move(console));
        }
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Cannot open log file " + config.filepath,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

template<int InstanceId>
void LogManager::SetLevel(plog::Severity level)
{
    if (auto* logger = plog::get<InstanceId>())
        logger->setMaxSeverity(level);
}

template void LogManager::SetLevel<0>(plog::Severity);

void LogManager::Shutdown()
{
    // plog keeps raw appender pointers; detach by silencing before releasing them
    SetLevel<0>(plog::none);
    s_appenders.clear();
    s_initialized = false;
}

const std::string& LogManager::GetLogDirectory() { return s_log_dir; }

plog::Severity LogManager::SeverityFromLevel(int level)
{
    return static_cast<plog::Severity>(std::clamp(level, static_cast<int>(plog::none), static_cast<int>(plog::verbose)));
}

} // namespace utils
