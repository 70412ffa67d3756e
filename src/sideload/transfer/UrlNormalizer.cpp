#include "UrlNormalizer.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <cctype>
#include <utility>

namespace
{

constexpr const char* kStorageHost = "firebasestorage.googleapis.com";

std::string trim(const std::string& s)
{
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

bool startsWith(const std::string& s, const char* prefix)
{
    return s.rfind(prefix, 0) == 0;
}

std::string lower(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

// Host part of an http(s) URL, empty when malformed.
std::string hostOf(const std::string& url)
{
    auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos)
        return {};
    auto host_begin = scheme_end + 3;
    auto host_end = url.find_first_of("/?#", host_begin);
    std::string authority = url.substr(host_begin, host_end == std::string::npos ? std::string::npos
                                                                                  : host_end - host_begin);
    auto at = authority.rfind('@');
    if (at != std::string::npos)
        authority = authority.substr(at + 1);
    auto colon = authority.find(':');
    if (colon != std::string::npos)
        authority = authority.substr(0, colon);
    return lower(authority);
}

// Sets alt=media, replacing any alt parameter already present.
std::string forceAltMedia(const std::string& url)
{
    std::string fragment;
    std::string base = url;
    auto hash = base.find('#');
    if (hash != std::string::npos)
    {
        fragment = base.substr(hash);
        base = base.substr(0, hash);
    }

    auto q = base.find('?');
    if (q == std::string::npos)
        return base + "?alt=media" + fragment;

    std::string path = base.substr(0, q);
    std::string query = base.substr(q + 1);
    std::string rebuilt;
    size_t pos = 0;
    while (pos <= query.size())
    {
        auto amp = query.find('&', pos);
        std::string param = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        if (!param.empty() && !startsWith(param, "alt=") && param != "alt")
        {
            rebuilt += rebuilt.empty() ? "" : "&";
            rebuilt += param;
        }
        if (amp == std::string::npos)
            break;
        pos = amp + 1;
    }
    rebuilt += rebuilt.empty() ? "alt=media" : "&alt=media";
    return path + "?" + rebuilt + fragment;
}

} // namespace

namespace sideload
{

UrlNormalizer::UrlNormalizer(std::string defaultBucket)
    : default_bucket_(std::move(defaultBucket))
{
}

bool UrlNormalizer::normalize(const std::string& url, std::string& outUrl, std::string& outError) const
{
    std::string input = trim(url);
    if (input.empty())
    {
        outError = "No URL provided";
        return false;
    }

    if (input.find_first_of(" \t\r\n") != std::string::npos)
    {
        outError = "URL contains whitespace: " + input;
        return false;
    }

    std::string scheme_lower = lower(input.substr(0, std::min<size_t>(input.size(), 8)));
    if (startsWith(scheme_lower, "http://") || startsWith(scheme_lower, "https://"))
    {
        std::string host = hostOf(input);
        if (host.empty())
        {
            outError = "URL has no host: " + input;
            return false;
        }
        outUrl = host == kStorageHost ? forceAltMedia(input) : input;
        return true;
    }

    if (startsWith(scheme_lower, "gs://"))
    {
        std::string rest = input.substr(5);
        auto slash = rest.find('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 >= rest.size())
        {
            outError = "Storage reference needs a bucket and an object path: " + input;
            return false;
        }
        outUrl = storageUrl(rest.substr(0, slash), rest.substr(slash + 1));
        PLOG_DEBUG << "Rewrote storage reference " << input << " -> " << outUrl;
        return true;
    }

    if (input.front() == '/')
    {
        auto first = input.find_first_not_of('/');
        if (first == std::string::npos)
        {
            outError = "Storage path is empty";
            return false;
        }
        if (default_bucket_.empty())
        {
            outError = "No storage bucket configured for path: " + input;
            return false;
        }
        outUrl = storageUrl(default_bucket_, input.substr(first));
        PLOG_DEBUG << "Rewrote storage path " << input << " -> " << outUrl;
        return true;
    }

    outError = "Unsupported URL format: " + input;
    return false;
}

std::string UrlNormalizer::storageUrl(const std::string& bucket, const std::string& objectPath) const
{
    return std::string("https://") + kStorageHost + "/v0/b/" + bucket + "/o/" + encodeComponent(objectPath) +
           "?alt=media";
}

std::string UrlNormalizer::encodeComponent(const std::string& value)
{
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value)
    {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~')
        {
            out.push_back(static_cast<char>(c));
        }
        else
        {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

std::string UrlNormalizer::pathExtension(const std::string& url)
{
    std::string path = url.substr(0, url.find_first_of("?#"));
    auto scheme_end = path.find("://");
    if (scheme_end != std::string::npos)
    {
        auto path_begin = path.find('/', scheme_end + 3);
        path = path_begin == std::string::npos ? std::string() : path.substr(path_begin);
    }

    // Encoded storage object names carry their separators as %2F
    auto last = path.find_last_of('/');
    std::string segment = last == std::string::npos ? path : path.substr(last + 1);
    auto encoded_sep = lower(segment).rfind("%2f");
    if (encoded_sep != std::string::npos)
        segment = segment.substr(encoded_sep + 3);

    auto dot = segment.find_last_of('.');
    if (dot == std::string::npos || dot + 1 >= segment.size())
        return {};
    return lower(segment.substr(dot + 1));
}

} // namespace sideload
