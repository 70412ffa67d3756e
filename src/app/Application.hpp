#pragma once

#include <memory>
#include <string>
#include <vector>

class AppSettings;
class AdbPlatformBridge;
class ConfigManager;
class CprHttpClient;
class JsonFileStore;
class SingleInstanceGuard;

namespace sideload
{
class TransferController;
struct TransferOutcome;
} // namespace sideload

// Command-line host: parses arguments, wires the pipeline to the terminal, adb
// and the state file, and turns outcomes into exit codes.
class Application
{
public:
    static constexpr int kExitOk = 0;
    static constexpr int kExitFailure = 1;
    static constexpr int kExitNeedsUser = 2;

    Application(int argc, char** argv);
    ~Application();

    int run();

    static int exitCodeFor(const sideload::TransferOutcome& outcome);

private:
    struct Options
    {
        std::string config_path = "config.toml";
        bool verbose = false;
        bool help = false;
        bool version = false;
        std::vector<std::string> command;
    };

    bool parseCommandLineArgs(std::string& outError);
    bool initializeLogging();
    bool initializeConfig();
    bool checkSingleInstance();
    void setupServices();
    int dispatch();
    void resumePendingOnStart();
    void cleanup();

    int cmdFetch(const std::vector<std::string>& args);
    int cmdResume();
    int cmdUpload(const std::vector<std::string>& args);
    int cmdInspect(const std::vector<std::string>& args);
    int cmdStatus();
    int cmdGrant(const std::vector<std::string>& args, bool granted);
    int cmdConfig(const std::vector<std::string>& args);

    void printUsage() const;
    void reportPendingErrors() const;

    Options options_;
    std::unique_ptr<AppSettings> settings_;
    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<SingleInstanceGuard> instance_guard_;
    std::shared_ptr<JsonFileStore> store_;
    std::shared_ptr<AdbPlatformBridge> bridge_;
    std::shared_ptr<CprHttpClient> http_;
    std::unique_ptr<sideload::TransferController> controller_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
