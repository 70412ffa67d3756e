#include <catch2/catch_test_macros.hpp>
#include "storage/JsonFileStore.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/mock_platform.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

using test_utils::TempDir;

TEST_CASE("JsonFileStore - persistence", "[storage]") {
    TempDir dir;
    std::string path = dir.file("state/state.json");

    {
        JsonFileStore store(path);
        REQUIRE_FALSE(store.get("missing").has_value());
        store.set("pending_installation", R"({"file_path":"/tmp/a.apk"})");
        store.set("consent.storage", "granted");
        store.remove("never-set");
    }

    REQUIRE(std::filesystem::exists(path));
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    JsonFileStore reopened(path);
    REQUIRE(reopened.get("consent.storage") == std::optional<std::string>("granted"));
    REQUIRE(reopened.get("pending_installation") == std::optional<std::string>(R"({"file_path":"/tmp/a.apk"})"));

    reopened.remove("consent.storage");
    JsonFileStore third(path);
    REQUIRE_FALSE(third.get("consent.storage").has_value());
    REQUIRE(third.get("pending_installation").has_value());
}

TEST_CASE("JsonFileStore - damaged files", "[storage]") {
    TempDir dir;
    utils::ErrorReporter::ClearErrors();

    SECTION("Corrupt JSON reads as empty and is reported") {
        std::string path = dir.write("state.json", "{ not json");
        JsonFileStore store(path);
        REQUIRE_FALSE(store.get("anything").has_value());
        REQUIRE(utils::ErrorReporter::HasPendingErrors());
        REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Storage);

        // The next write replaces the damaged file
        store.set("k", "v");
        auto doc = nlohmann::json::parse(test_utils::readFile(path));
        REQUIRE(doc["k"] == "v");
    }

    SECTION("Non-string entries are skipped") {
        std::string path = dir.write("state.json", R"({"a": "1", "b": 2, "c": {"x": 1}})");
        JsonFileStore store(path);
        REQUIRE(store.get("a") == std::optional<std::string>("1"));
        REQUIRE_FALSE(store.get("b").has_value());
        REQUIRE_FALSE(store.get("c").has_value());
    }

    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("JsonFileStore - failed writes roll back", "[storage]") {
    TempDir dir;
    // A directory where the temp file should go makes every flush fail
    std::string path = dir.file("state.json");
    std::filesystem::create_directories(path + ".tmp");

    JsonFileStore store(path);
    REQUIRE_THROWS_AS(store.set("k", "v"), sideload::StoreError);
    REQUIRE_FALSE(store.get("k").has_value());
}
