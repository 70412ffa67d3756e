#include "Application.hpp"
#include "HostServices.hpp"
#include "app/Version.hpp"
#include "config/AppSettings.hpp"
#include "config/ConfigManager.hpp"
#include "http/CprHttpClient.hpp"
#include "platform/AdbPlatformBridge.hpp"
#include "platform/SingleInstanceGuard.hpp"
#include "storage/JsonFileStore.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include "sideload/controller/TransferController.hpp"
#include "sideload/install/PackageProbe.hpp"
#include "sideload/upload/UploadEngine.hpp"

#include <plog/Log.h>

#include <atomic>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <functional>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <mutex>
#include <sstream>
#include <thread>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace
{

std::atomic<bool> g_interrupted{ false };

void OnInterrupt(int)
{
    g_interrupted.store(true);
}

// Polls the interrupt flag while a command runs and forwards it once.
class InterruptWatcher
{
public:
    explicit InterruptWatcher(std::function<void()> onInterrupt)
        : on_interrupt_(std::move(onInterrupt))
    {
        g_interrupted.store(false);
        previous_ = std::signal(SIGINT, OnInterrupt);
        thread_ = std::thread([this]() {
            while (!stop_.load())
            {
                if (g_interrupted.exchange(false))
                {
                    PLOG_INFO << "Interrupt received, cancelling";
                    on_interrupt_();
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
            }
        });
    }

    ~InterruptWatcher()
    {
        stop_.store(true);
        if (thread_.joinable())
            thread_.join();
        std::signal(SIGINT, previous_ == SIG_ERR ? SIG_DFL : previous_);
    }

    InterruptWatcher(const InterruptWatcher&) = delete;
    InterruptWatcher& operator=(const InterruptWatcher&) = delete;

private:
    std::function<void()> on_interrupt_;
    std::atomic<bool> stop_{ false };
    std::thread thread_;
    void (*previous_)(int) = SIG_DFL;
};

std::string formatBytes(std::uint64_t bytes)
{
    std::ostringstream ss;
    if (bytes >= 1024ULL * 1024ULL)
        ss << std::fixed << std::setprecision(1) << bytes / (1024.0 * 1024.0) << " MiB";
    else if (bytes >= 1024ULL)
        ss << std::fixed << std::setprecision(1) << bytes / 1024.0 << " KiB";
    else
        ss << bytes << " B";
    return ss.str();
}

// Last path segment of the URL without query or fragment
std::string guessDisplayName(const std::string& url)
{
    std::string path = url.substr(0, url.find_first_of("?#"));
    auto slash = path.find_last_of('/');
    std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
    auto pct = name.rfind("%2F");
    if (pct != std::string::npos)
        name = name.substr(pct + 3);
    return name;
}

// Reads "--flag value" pairs out of args, leaving the positionals
bool takeOption(std::vector<std::string>& args, const std::string& flag, std::string& outValue,
                std::string& outError)
{
    for (auto it = args.begin(); it != args.end(); ++it)
    {
        if (*it != flag)
            continue;
        if (std::next(it) == args.end())
        {
            outError = flag + " needs a value";
            return false;
        }
        outValue = *std::next(it);
        args.erase(it, std::next(it, 2));
        return true;
    }
    return true;
}

void printMessage(const sideload::UserMessage& message)
{
    auto& stream = message.messageClass == sideload::MessageClass::Retryable ? std::cerr : std::cout;
    stream << message.text << std::endl;
}

class ProgressLine
{
public:
    void show(const std::string& text)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << '\r' << text << "        " << std::flush;
        dirty_ = true;
    }

    void finish()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (dirty_)
            std::cout << std::endl;
        dirty_ = false;
    }

private:
    std::mutex mutex_;
    bool dirty_ = false;
};

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { cleanup(); }

int Application::run()
{
    std::string error;
    if (!parseCommandLineArgs(error))
    {
        std::cerr << "sideload: " << error << "\n\n";
        printUsage();
        return kExitFailure;
    }

    if (options_.version)
    {
        std::cout << "sideload " << SIDELOAD_VERSION_STRING << std::endl;
        return kExitOk;
    }

    if (options_.help || options_.command.empty())
    {
        printUsage();
        return options_.help ? kExitOk : kExitFailure;
    }

#ifdef _WIN32
    SetConsoleOutputCP(CP_UTF8);
#endif

    // A broken config keeps the defaults; the parse error is reported on exit
    bool configOk = initializeConfig();

    if (!initializeLogging())
    {
        reportPendingErrors();
        return kExitFailure;
    }

    PLOG_INFO << "sideload " << SIDELOAD_VERSION_STRING << " starting: " << options_.command.front();
    if (!configOk)
        PLOG_WARNING << "Using default settings: " << config_->lastError();

    int code = kExitFailure;
    try
    {
        code = dispatch();
    }
    catch (const std::exception& ex)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Unknown, "Unexpected error", ex.what());
        code = kExitFailure;
    }

    reportPendingErrors();
    PLOG_INFO << "Exiting with code " << code;
    return code;
}

bool Application::parseCommandLineArgs(std::string& outError)
{
    for (int i = 1; i < argc_; ++i)
    {
        std::string arg = argv_[i] ? argv_[i] : "";

        // Global flags are only recognised before the command
        if (options_.command.empty())
        {
            if (arg == "--help" || arg == "-h")
            {
                options_.help = true;
                continue;
            }
            if (arg == "--version")
            {
                options_.version = true;
                continue;
            }
            if (arg == "--verbose" || arg == "-v")
            {
                options_.verbose = true;
                continue;
            }
            if (arg == "--config")
            {
                if (i + 1 >= argc_)
                {
                    outError = "--config needs a path";
                    return false;
                }
                options_.config_path = argv_[++i];
                continue;
            }
            if (arg.size() > 1 && arg[0] == '-')
            {
                outError = "unknown option " + arg;
                return false;
            }
        }

        options_.command.push_back(std::move(arg));
    }
    return true;
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize("logs"))
        return false;

    const auto& logging = settings_->logging;
    return utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                  .filepath = utils::LogManager::GetLogDirectory() + "/sideload.log",
                                                  .append = logging.append,
                                                  .level = options_.verbose
                                                               ? plog::debug
                                                               : utils::LogManager::SeverityFromLevel(logging.level),
                                                  .mirror_to_console = options_.verbose });
}

bool Application::initializeConfig()
{
    settings_ = std::make_unique<AppSettings>();
    config_ = std::make_unique<ConfigManager>(options_.config_path);
    settings_->registerConfigHandler(*config_);

    // Parse errors are already queued by ConfigManager
    return config_->load();
}

bool Application::checkSingleInstance()
{
    instance_guard_ = SingleInstanceGuard::Acquire(settings_->storage.state_file + ".lock");
    return instance_guard_ != nullptr;
}

void Application::setupServices()
{
    const auto& s = *settings_;

    store_ = std::make_shared<JsonFileStore>(s.storage.state_file);

    AdbPlatformBridge::Settings bridgeSettings;
    bridgeSettings.adb = s.platform.adb;
    bridgeSettings.serial = s.platform.serial;
    bridgeSettings.osVersionOverride = s.platform.os_version;
    bridgeSettings.installer = s.install.installer;
    bridgeSettings.installerArgs = s.install.installer_args;
    bridge_ = std::make_shared<AdbPlatformBridge>(std::move(bridgeSettings), store_, std::cin, std::cout);

    http_ = std::make_shared<CprHttpClient>(HttpSettings{ .connect_timeout_ms = s.transfer.connect_timeout_ms,
                                                          .low_speed_timeout_s = s.transfer.low_speed_timeout_s,
                                                          .user_agent = s.transfer.user_agent });

    sideload::ControllerDependencies deps;
    deps.platform = bridge_;
    deps.http = http_;
    deps.store = store_;
    deps.notifications = std::make_shared<LogNotificationSink>();
    deps.usageCounter = std::make_shared<StoreUsageCounter>(store_);
    deps.download = sideload::DownloadSettings{ .directory = s.transfer.download_dir,
                                                .minimumBytes = s.transfer.min_package_bytes,
                                                .progressByteBucket = s.transfer.progress_byte_bucket,
                                                .storageBucket = s.transfer.storage_bucket };
    deps.installMode = s.install.use_session ? sideload::InstallMode::Session : sideload::InstallMode::Intent;

    controller_ = std::make_unique<sideload::TransferController>(std::move(deps));
}

int Application::dispatch()
{
    const std::string& name = options_.command.front();
    std::vector<std::string> args(options_.command.begin() + 1, options_.command.end());

    if (name == "inspect")
        return cmdInspect(args);
    if (name == "config")
        return cmdConfig(args);

    if (name != "fetch" && name != "resume" && name != "upload" && name != "status" && name != "grant" &&
        name != "revoke")
    {
        std::cerr << "sideload: unknown command '" << name << "'\n\n";
        printUsage();
        return kExitFailure;
    }

    if (!checkSingleInstance())
        return kExitFailure;

    setupServices();

    if (name == "fetch" || name == "status")
        resumePendingOnStart();

    if (name == "fetch")
        return cmdFetch(args);
    if (name == "resume")
        return cmdResume();
    if (name == "upload")
        return cmdUpload(args);
    if (name == "status")
        return cmdStatus();
    return cmdGrant(args, name == "grant");
}

// A package left waiting by an earlier run is retried before new work can replace it
void Application::resumePendingOnStart()
{
    if (!controller_->pendingInstallation())
        return;

    PLOG_INFO << "Found a pending installation from an earlier run";
    auto outcome = controller_->resumePendingInstallation();
    if (outcome.kind != sideload::OutcomeKind::NothingToResume)
        printMessage(sideload::TransferController::describe(outcome));
}

int Application::exitCodeFor(const sideload::TransferOutcome& outcome)
{
    switch (outcome.kind)
    {
    case sideload::OutcomeKind::Success:
    case sideload::OutcomeKind::NothingToResume:
        return kExitOk;
    case sideload::OutcomeKind::InstallDeferred:
    case sideload::OutcomeKind::PermissionDenied:
        return kExitNeedsUser;
    case sideload::OutcomeKind::Cancelled:
    case sideload::OutcomeKind::DownloadFailed:
    case sideload::OutcomeKind::InstallFailed:
    default:
        return kExitFailure;
    }
}

int Application::cmdFetch(const std::vector<std::string>& argsIn)
{
    std::vector<std::string> args = argsIn;
    sideload::FetchRequest request;
    std::string error;
    if (!takeOption(args, "--name", request.displayName, error) ||
        !takeOption(args, "--sha256", request.expectedSha256, error))
    {
        std::cerr << "sideload fetch: " << error << std::endl;
        return kExitFailure;
    }
    if (args.size() != 1)
    {
        std::cerr << "sideload fetch: expected exactly one URL" << std::endl;
        return kExitFailure;
    }

    request.url = args.front();
    if (request.displayName.empty())
        request.displayName = guessDisplayName(request.url);

    ProgressLine line;
    sideload::TransferOutcome outcome;
    {
        InterruptWatcher watcher([this]() { controller_->cancelActiveTransfer(); });
        outcome = controller_->fetchAndInstall(request, [&line](const sideload::TransferProgress& p) {
            if (p.sizeKnown())
                line.show("Downloading " + std::to_string(p.percent) + "% (" + formatBytes(p.transferredBytes) +
                          " / " + formatBytes(*p.totalBytes) + ")");
            else
                line.show("Downloading " + formatBytes(p.transferredBytes));
        });
    }
    line.finish();

    if (outcome.kind == sideload::OutcomeKind::DownloadFailed)
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Network, "Download failed", outcome.reason);
    else if (outcome.kind == sideload::OutcomeKind::InstallFailed)
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Install, "Installation failed", outcome.reason);

    printMessage(sideload::TransferController::describe(outcome));
    return exitCodeFor(outcome);
}

int Application::cmdResume()
{
    auto outcome = controller_->resumePendingInstallation();
    printMessage(sideload::TransferController::describe(outcome));
    return exitCodeFor(outcome);
}

int Application::cmdUpload(const std::vector<std::string>& argsIn)
{
    std::vector<std::string> args = argsIn;
    std::string prefix;
    std::string error;
    if (!takeOption(args, "--key-prefix", prefix, error))
    {
        std::cerr << "sideload upload: " << error << std::endl;
        return kExitFailure;
    }
    if (args.empty())
    {
        std::cerr << "sideload upload: no files given" << std::endl;
        return kExitFailure;
    }
    if (settings_->upload.endpoint.empty())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "No upload endpoint configured",
                                          "Set [upload] endpoint in " + options_.config_path);
        return kExitFailure;
    }

    std::vector<sideload::UploadItem> items;
    for (const auto& file : args)
    {
        std::error_code ec;
        if (!fs::is_regular_file(file, ec))
        {
            std::cerr << "sideload upload: not a file: " << file << std::endl;
            return kExitFailure;
        }
        items.push_back({ file, prefix + fs::path(file).filename().string() });
    }

    sideload::UploadEngine engine(http_, { .endpoint = settings_->upload.endpoint,
                                           .maxParallel = static_cast<std::size_t>(settings_->upload.max_parallel) });
    auto token = std::make_shared<sideload::CancellationToken>();

    ProgressLine line;
    sideload::UploadBatchResult result;
    {
        InterruptWatcher watcher([&engine]() { engine.cancelAllUploads(); });
        result = engine.uploadBatch(items, [&line](int percent) {
            line.show("Uploading " + std::to_string(percent) + "%");
        }, token);
    }
    line.finish();

    for (const auto& file : result.files)
    {
        if (file.status == sideload::FileUploadStatus::Uploaded)
            std::cout << "  " << file.localPath << " -> " << file.remoteUrl << '\n';
        else if (file.status == sideload::FileUploadStatus::Failed)
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Upload, "Upload failed: " + file.localPath,
                                              file.error);
    }

    printMessage(sideload::TransferController::describe(result));
    return result.ok() ? kExitOk : kExitFailure;
}

int Application::cmdInspect(const std::vector<std::string>& args)
{
    if (args.size() != 1)
    {
        std::cerr << "sideload inspect: expected exactly one file" << std::endl;
        return kExitFailure;
    }

    sideload::PackageInfo info;
    std::string error;
    if (!sideload::PackageProbe::Probe(args.front(), info, error))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Storage, "Cannot inspect " + args.front(), error);
        return kExitFailure;
    }

    std::cout << "File:        " << info.fileName << '\n'
              << "Size:        " << formatBytes(info.sizeBytes) << '\n'
              << "App name:    " << info.appName << '\n'
              << "Version:     " << (info.version.empty() ? "unknown" : info.version) << '\n'
              << "Package:     " << info.packageName << '\n'
              << "Archive:     " << (info.isArchive ? "yes (" + std::to_string(info.entryCount) + " entries)" : "no")
              << '\n'
              << "Manifest:    " << (info.hasManifest ? "yes" : "no") << '\n'
              << "Code (dex):  " << (info.hasDex ? "yes" : "no") << '\n'
              << "Installable: " << (info.looksInstallable() ? "probably" : "unlikely") << std::endl;
    return kExitOk;
}

int Application::cmdStatus()
{
    sideload::PermissionTier tier;
    if (controller_->permissions().currentTier(tier))
        std::cout << "Permission tier: " << sideload::toString(tier) << '\n';
    else
        std::cout << "Permission tier: unknown (device not reachable)\n";

    try
    {
        for (auto grant : { sideload::Grant::Storage, sideload::Grant::ManageAllFiles, sideload::Grant::MediaImages,
                            sideload::Grant::MediaVideo })
        {
            std::cout << "  " << std::left << std::setw(18) << sideload::toString(grant)
                      << (bridge_->checkGrant(grant) ? "granted" : "not granted") << '\n';
        }
        std::cout << "  " << std::left << std::setw(18) << "install"
                  << (bridge_->hasInstallPermission() ? "granted" : "not granted") << '\n';

        StoreUsageCounter counter(store_);
        std::cout << "Downloads so far: " << counter.count() << '\n';
    }
    catch (const sideload::StoreError& ex)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Storage, "Cannot read state file", ex.what());
        return kExitFailure;
    }

    if (auto pending = controller_->pendingInstallation())
    {
        std::cout << "Pending installation: " << pending->filePath;
        std::error_code ec;
        if (!fs::exists(pending->filePath, ec))
            std::cout << " (file missing)";
        std::cout << '\n';
    }
    else
    {
        std::cout << "Pending installation: none\n";
    }
    std::cout << std::flush;
    return kExitOk;
}

int Application::cmdGrant(const std::vector<std::string>& args, bool granted)
{
    const char* verb = granted ? "grant" : "revoke";
    if (args.size() != 1)
    {
        std::cerr << "sideload " << verb << ": expected one of storage, manage-all-files, media-images, "
                  << "media-video, install" << std::endl;
        return kExitFailure;
    }

    std::string error;
    bool ok = false;
    if (args.front() == "install")
    {
        ok = bridge_->setInstallConsent(granted, error);
    }
    else
    {
        sideload::Grant grant;
        if (!AdbPlatformBridge::ParseGrantName(args.front(), grant))
        {
            std::cerr << "sideload " << verb << ": unknown grant '" << args.front() << "'" << std::endl;
            return kExitFailure;
        }
        ok = bridge_->setGrant(grant, granted, error);
    }

    if (!ok)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Storage, "Could not update consent", error);
        return kExitFailure;
    }

    std::cout << (granted ? "Granted " : "Revoked ") << args.front() << std::endl;
    return kExitOk;
}

int Application::cmdConfig(const std::vector<std::string>& args)
{
    if (args.size() != 1 || args.front() != "init")
    {
        std::cerr << "sideload config: only 'init' is supported" << std::endl;
        return kExitFailure;
    }

    std::error_code ec;
    if (fs::exists(config_->configPath(), ec))
    {
        std::cerr << "sideload config: " << config_->configPath() << " already exists" << std::endl;
        return kExitFailure;
    }

    settings_->applyDefaults();
    if (!config_->save())
        return kExitFailure;

    std::cout << "Wrote " << config_->configPath() << std::endl;
    return kExitOk;
}

void Application::printUsage() const
{
    std::cout << "Usage: sideload [--config PATH] [--verbose] <command> [args]\n"
                 "\n"
                 "Commands:\n"
                 "  fetch <url> [--name NAME] [--sha256 HEX]   download a package and install it\n"
                 "  resume                                     continue an installation waiting for consent\n"
                 "  upload <file>... [--key-prefix PREFIX]     upload files to the configured endpoint\n"
                 "  inspect <file>                             show what a package file looks like\n"
                 "  status                                     show permission tier, grants and pending work\n"
                 "  grant <name> | revoke <name>               record consent: storage, manage-all-files,\n"
                 "                                             media-images, media-video, install\n"
                 "  config init                                write a config file with default values\n"
                 "\n"
                 "Options:\n"
                 "  --config PATH   configuration file (default: config.toml)\n"
                 "  --verbose       debug logging, mirrored to the console\n"
                 "  --version       print the version\n"
                 "  --help          print this help\n"
              << std::flush;
}

void Application::reportPendingErrors() const
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        if (report.severity == utils::ErrorSeverity::Info)
            continue;

        std::cerr << utils::ErrorReporter::SeverityToString(report.severity) << ": " << report.user_message;
        if (!report.technical_details.empty())
            std::cerr << " (" << report.technical_details << ")";
        std::cerr << '\n';
    }
    std::cerr << std::flush;
}

void Application::cleanup()
{
    controller_.reset();
    bridge_.reset();
    http_.reset();
    store_.reset();
    instance_guard_.reset();
    config_.reset();
    settings_.reset();
    utils::LogManager::Shutdown();
}
