#pragma once

#include <string>

namespace sideload
{

// Rewrites cloud-storage references into canonical HTTPS download URLs.
//
//   gs://bucket/path/app.apk  -> https://firebasestorage.googleapis.com/v0/b/bucket/o/path%2Fapp.apk?alt=media
//   /path/app.apk             -> same form, using the configured default bucket
//   https://firebasestorage.googleapis.com/...  -> alt=media forced
//   other http(s) URLs        -> unchanged
class UrlNormalizer
{
public:
    explicit UrlNormalizer(std::string defaultBucket = {});

    bool normalize(const std::string& url, std::string& outUrl, std::string& outError) const;

    const std::string& defaultBucket() const { return default_bucket_; }

    // Percent-encodes everything outside the RFC 3986 unreserved set, including '/'.
    static std::string encodeComponent(const std::string& value);

    // Extension of the last path segment without the dot, lower-cased. Empty when absent.
    static std::string pathExtension(const std::string& url);

private:
    std::string storageUrl(const std::string& bucket, const std::string& objectPath) const;

    std::string default_bucket_;
};

} // namespace sideload
