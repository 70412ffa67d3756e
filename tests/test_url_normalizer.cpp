#include <catch2/catch_test_macros.hpp>
#include "sideload/transfer/UrlNormalizer.hpp"

using sideload::UrlNormalizer;

TEST_CASE("UrlNormalizer - absolute URLs", "[download][url]") {
    UrlNormalizer normalizer("demo-bucket");
    std::string out;
    std::string error;

    SECTION("Plain https URLs pass through") {
        REQUIRE(normalizer.normalize("https://example.com/apps/app.apk", out, error));
        REQUIRE(out == "https://example.com/apps/app.apk");
    }

    SECTION("Surrounding whitespace is trimmed") {
        REQUIRE(normalizer.normalize("  http://example.com/a.apk\n", out, error));
        REQUIRE(out == "http://example.com/a.apk");
    }

    SECTION("Storage URLs get alt=media appended") {
        REQUIRE(normalizer.normalize("https://firebasestorage.googleapis.com/v0/b/b/o/app.apk", out, error));
        REQUIRE(out == "https://firebasestorage.googleapis.com/v0/b/b/o/app.apk?alt=media");
    }

    SECTION("Storage URLs keep other parameters and replace alt") {
        REQUIRE(normalizer.normalize(
            "https://firebasestorage.googleapis.com/v0/b/b/o/app.apk?alt=json&token=abc", out, error));
        REQUIRE(out == "https://firebasestorage.googleapis.com/v0/b/b/o/app.apk?token=abc&alt=media");
    }
}

TEST_CASE("UrlNormalizer - storage references", "[download][url]") {
    std::string out;
    std::string error;

    SECTION("gs:// uses the bucket from the reference") {
        UrlNormalizer normalizer("other");
        REQUIRE(normalizer.normalize("gs://my-bucket/builds/app+v2.apk", out, error));
        REQUIRE(out == "https://firebasestorage.googleapis.com/v0/b/my-bucket/o/builds%2Fapp%2Bv2.apk?alt=media");
    }

    SECTION("Bare paths use the configured bucket") {
        UrlNormalizer normalizer("demo-bucket");
        REQUIRE(normalizer.normalize("/apps/app.apk", out, error));
        REQUIRE(out == "https://firebasestorage.googleapis.com/v0/b/demo-bucket/o/apps%2Fapp.apk?alt=media");
    }

    SECTION("Bare paths without a bucket are rejected") {
        UrlNormalizer normalizer;
        REQUIRE_FALSE(normalizer.normalize("/apps/app.apk", out, error));
        REQUIRE_FALSE(error.empty());
    }

    SECTION("gs:// without an object path is rejected") {
        UrlNormalizer normalizer;
        REQUIRE_FALSE(normalizer.normalize("gs://bucket-only", out, error));
        REQUIRE_FALSE(normalizer.normalize("gs://bucket/", out, error));
    }
}

TEST_CASE("UrlNormalizer - rejects malformed input", "[download][url]") {
    UrlNormalizer normalizer("demo-bucket");
    std::string out;
    std::string error;

    REQUIRE_FALSE(normalizer.normalize("", out, error));
    REQUIRE_FALSE(normalizer.normalize("   ", out, error));
    REQUIRE_FALSE(normalizer.normalize("ftp://example.com/app.apk", out, error));
    REQUIRE_FALSE(normalizer.normalize("example.com/app.apk", out, error));
    REQUIRE_FALSE(normalizer.normalize("https://", out, error));
    REQUIRE_FALSE(normalizer.normalize("https://example.com/my app.apk", out, error));
    REQUIRE_FALSE(normalizer.normalize("///", out, error));
}

TEST_CASE("UrlNormalizer - helpers", "[download][url]") {
    REQUIRE(UrlNormalizer::encodeComponent("a/b c~d") == "a%2Fb%20c~d");
    REQUIRE(UrlNormalizer::pathExtension("https://example.com/dir/App.APK?x=1") == "apk");
    REQUIRE(UrlNormalizer::pathExtension("https://h/v0/b/b/o/dir%2Fgame.xapk?alt=media") == "xapk");
    REQUIRE(UrlNormalizer::pathExtension("https://example.com/download") == "");
    REQUIRE(UrlNormalizer::pathExtension("https://example.com") == "");
}
