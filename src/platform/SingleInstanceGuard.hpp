#pragma once

#include <memory>
#include <string>

// Held for the lifetime of a command that touches the pending-install record or
// the download directory. A second process using the same lock file is refused.
class SingleInstanceGuard
{
public:
    static std::unique_ptr<SingleInstanceGuard> Acquire(const std::string& lockPath);
    ~SingleInstanceGuard();

    SingleInstanceGuard(const SingleInstanceGuard&) = delete;
    SingleInstanceGuard& operator=(const SingleInstanceGuard&) = delete;

private:
#ifdef _WIN32
    SingleInstanceGuard(void* handle, std::wstring name);
    void* mutex_handle_ = nullptr;
    std::wstring mutex_name_;
#else
    SingleInstanceGuard(int fd, std::string path);
    int fd_ = -1;
    std::string lock_path_;
#endif
};
