#include <catch2/catch_test_macros.hpp>
#include "app/Application.hpp"
#include "sideload/install/PendingInstallStore.hpp"
#include "storage/JsonFileStore.hpp"
#include "utils/mock_platform.hpp"

#include <fstream>
#include <string>
#include <vector>

using test_utils::TempDir;

namespace {

int runCommand(const std::vector<std::string>& words) {
    std::vector<std::string> args = words;
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    Application app(static_cast<int>(args.size()), argv.data());
    return app.run();
}

}  // namespace

TEST_CASE("Application - pending record is checked on start", "[app]") {
    TempDir dir;
    std::string state = dir.file("state.json");
    std::string config = dir.file("config.toml");
    std::ofstream(config) << "[platform]\nos_version = 33\n\n"
                          << "[storage]\nstate_file = '" << state << "'\n\n"
                          << "[transfer]\ndownload_dir = '" << dir.file("downloads") << "'\n";

    {
        JsonFileStore store(state);
        store.set(sideload::PendingInstallStore::kKey, dir.file("downloads/gone_1.apk"));
    }

    REQUIRE(runCommand({"sideload", "--config", config, "status"}) == Application::kExitOk);

    JsonFileStore after(state);
    REQUIRE_FALSE(after.get(sideload::PendingInstallStore::kKey).has_value());
}
