#include <catch2/catch_test_macros.hpp>
#include "config/AppSettings.hpp"
#include "config/ConfigManager.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/mock_platform.hpp"

#include <toml++/toml.h>

using test_utils::TempDir;

TEST_CASE("AppSettings - defaults", "[config]") {
    AppSettings settings;
    REQUIRE(settings.transfer.download_dir == "downloads");
    REQUIRE(settings.transfer.min_package_bytes == 1000);
    REQUIRE(settings.transfer.progress_byte_bucket == 100 * 1024);
    REQUIRE(settings.upload.max_parallel == 2);
    REQUIRE(settings.install.use_session);
    REQUIRE(settings.install.installer_args == std::vector<std::string>{"install", "-r"});
    REQUIRE(settings.platform.os_version == 0);
    REQUIRE(settings.storage.state_file == "state.json");
}

TEST_CASE("AppSettings - deserialize", "[config]") {
    AppSettings settings;

    SECTION("Values are read and clamped") {
        auto root = toml::parse(R"(
            [transfer]
            download_dir = "/data/apks"
            min_package_bytes = 4096
            storage_bucket = "demo-bucket"

            [upload]
            endpoint = "https://upload.example.com/o"
            max_parallel = 64

            [install]
            use_session = false
            installer_args = ["install", "-r", "-d"]

            [platform]
            os_version = 33
            serial = "emulator-5554"

            [logging]
            level = 42
        )");
        settings.deserialize(root);

        REQUIRE(settings.transfer.download_dir == "/data/apks");
        REQUIRE(settings.transfer.min_package_bytes == 4096);
        REQUIRE(settings.transfer.storage_bucket == "demo-bucket");
        REQUIRE(settings.upload.endpoint == "https://upload.example.com/o");
        REQUIRE(settings.upload.max_parallel == 16);
        REQUIRE_FALSE(settings.install.use_session);
        REQUIRE(settings.install.installer_args.size() == 3);
        REQUIRE(settings.platform.os_version == 33);
        REQUIRE(settings.platform.serial == "emulator-5554");
        REQUIRE(settings.logging.level == 6);
    }

    SECTION("Bad values fall back to defaults") {
        auto root = toml::parse(R"(
            [transfer]
            min_package_bytes = -5
            connect_timeout_ms = "soon"

            [upload]
            max_parallel = 0
        )");
        settings.deserialize(root);

        REQUIRE(settings.transfer.min_package_bytes == 1000);
        REQUIRE(settings.transfer.connect_timeout_ms == 10000);
        REQUIRE(settings.upload.max_parallel == 1);
    }

    SECTION("Missing sections reset to defaults") {
        settings.transfer.download_dir = "elsewhere";
        settings.deserialize(toml::table{});
        REQUIRE(settings.transfer.download_dir == "downloads");
    }
}

TEST_CASE("ConfigManager - load and save", "[config]") {
    TempDir dir;
    std::string path = dir.file("config.toml");

    SECTION("Missing file uses defaults") {
        ConfigManager config(path);
        AppSettings settings;
        settings.registerConfigHandler(config);
        REQUIRE(config.load());
        REQUIRE(settings.upload.max_parallel == 2);
    }

    SECTION("Saved settings load back and foreign keys survive") {
        dir.write("config.toml", "[custom]\nnote = \"kept\"\n\n[upload]\nendpoint = \"https://old\"\n");

        {
            ConfigManager config(path);
            AppSettings settings;
            settings.registerConfigHandler(config);
            REQUIRE(config.load());
            REQUIRE(settings.upload.endpoint == "https://old");

            settings.upload.endpoint = "https://new.example.com/o";
            settings.platform.os_version = 30;
            REQUIRE(config.save());
        }

        ConfigManager config(path);
        AppSettings settings;
        settings.registerConfigHandler(config);
        REQUIRE(config.load());
        REQUIRE(settings.upload.endpoint == "https://new.example.com/o");
        REQUIRE(settings.platform.os_version == 30);
        REQUIRE(config.root()["custom"]["note"].value_or(std::string()) == "kept");
    }

    SECTION("Parse errors are reported and keep defaults") {
        utils::ErrorReporter::ClearErrors();
        dir.write("config.toml", "[upload\nendpoint = ");

        ConfigManager config(path);
        AppSettings settings;
        settings.registerConfigHandler(config);
        REQUIRE_FALSE(config.load());
        REQUIRE(std::string(config.lastError()).find("parse error") != std::string::npos);
        REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Configuration);
        REQUIRE(settings.upload.endpoint.empty());
        utils::ErrorReporter::ClearErrors();
    }

    SECTION("Two handlers cannot own the same key") {
        ConfigManager config(path);
        AppSettings first;
        first.registerConfigHandler(config);

        TableCallbacks cb;
        cb.load = [](const toml::table&) {};
        cb.save = []() { return toml::table{}; };
        REQUIRE_FALSE(config.registerTable("", cb, {"upload"}));
        REQUIRE(config.registerTable("", cb, {"extra"}));
    }
}
