#include "SingleInstanceGuard.hpp"

#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <filesystem>
#include <string>
#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <exception>
#include <system_error>
#include <utility>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/file.h>
#include <unistd.h>
#endif

namespace
{

#ifdef _WIN32
std::wstring NormalizePathLower(const std::filesystem::path& path)
{
    std::wstring normalized;
    try
    {
        normalized = std::filesystem::weakly_canonical(path).wstring();
    }
    catch (const std::exception& ex)
    {
        PLOG_DEBUG << "weakly_canonical failed, using lexical form: " << ex.what();
        normalized = path.lexically_normal().wstring();
    }

    for (auto& ch : normalized)
    {
        if (ch >= L'A' && ch <= L'Z')
            ch = static_cast<wchar_t>(ch - L'A' + L'a');
    }
    return normalized;
}

std::wstring BuildMutexName(const std::filesystem::path& lock_path)
{
    constexpr wchar_t kMutexBaseName[] = L"Local\\SideloadInstance";

    auto normalized = NormalizePathLower(lock_path);

    // FNV-1a 64-bit
    std::uint64_t hash = 1469598103934665603ULL;
    for (wchar_t ch : normalized)
    {
        hash ^= static_cast<std::uint64_t>(ch);
        hash *= 1099511628211ULL;
    }

    wchar_t hash_buffer[17] = {};
    _snwprintf_s(hash_buffer, _countof(hash_buffer), _TRUNCATE, L"%016llx", static_cast<unsigned long long>(hash));

    std::wstring name(kMutexBaseName);
    name.push_back(L'-');
    name.append(hash_buffer);
    return name;
}
#endif

void ReportAlreadyRunning(const std::string& lockPath)
{
    PLOG_WARNING << "Another sideload instance holds " << lockPath;
    utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Another instance is already running",
                                        "Lock held: " + lockPath);
}

} // namespace

#ifdef _WIN32
SingleInstanceGuard::SingleInstanceGuard(void* handle, std::wstring name)
    : mutex_handle_(handle)
    , mutex_name_(std::move(name))
{
}
#else
SingleInstanceGuard::SingleInstanceGuard(int fd, std::string path)
    : fd_(fd)
    , lock_path_(std::move(path))
{
}
#endif

SingleInstanceGuard::~SingleInstanceGuard()
{
#ifdef _WIN32
    if (mutex_handle_)
    {
        ReleaseMutex(static_cast<HANDLE>(mutex_handle_));
        CloseHandle(static_cast<HANDLE>(mutex_handle_));
    }
#else
    if (fd_ >= 0)
    {
        flock(fd_, LOCK_UN);
        close(fd_);
    }
#endif
}

std::unique_ptr<SingleInstanceGuard> SingleInstanceGuard::Acquire(const std::string& lockPath)
{
    std::filesystem::path path(lockPath);
    if (path.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
    }

#ifdef _WIN32
    auto mutex_name = BuildMutexName(path);

    HANDLE mutex = CreateMutexW(nullptr, TRUE, mutex_name.c_str());
    if (!mutex)
    {
        DWORD err = GetLastError();
        PLOG_ERROR << "CreateMutexW failed: " << err;
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Single instance guard failure",
                                          "CreateMutexW failed with error " + std::to_string(err));
        return nullptr;
    }

    if (GetLastError() == ERROR_ALREADY_EXISTS)
    {
        CloseHandle(mutex);
        ReportAlreadyRunning(lockPath);
        return nullptr;
    }

    return std::unique_ptr<SingleInstanceGuard>(new SingleInstanceGuard(mutex, std::move(mutex_name)));
#else
    int fd = open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0)
    {
        int err = errno;
        PLOG_ERROR << "open(" << lockPath << ") failed: " << strerror(err);
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Single instance guard failure",
                                          "Could not open lock file " + lockPath + ": " + strerror(err));
        return nullptr;
    }

    if (flock(fd, LOCK_EX | LOCK_NB) != 0)
    {
        int err = errno;
        close(fd);
        if (err == EWOULDBLOCK)
        {
            ReportAlreadyRunning(lockPath);
        }
        else
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Single instance guard failure",
                                              std::string("flock failed: ") + strerror(err));
        }
        return nullptr;
    }

    PLOG_DEBUG << "Acquired instance lock " << lockPath;
    return std::unique_ptr<SingleInstanceGuard>(new SingleInstanceGuard(fd, lockPath));
#endif
}
