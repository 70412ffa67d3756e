#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <string>

namespace sideload
{

struct HeadResponse
{
    int status_code = 0;
    std::optional<std::uint64_t> content_length;
    std::string error; // non-empty on network/transport errors

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors
    bool aborted = false; // a callback asked to stop

    bool ok() const { return !aborted && error.empty() && status_code >= 200 && status_code < 300; }
};

// Receives each body chunk in order. Returning false aborts the transfer.
using ChunkSink = std::function<bool(const char* data, std::size_t size)>;

// Upload progress in bytes. Returning false aborts the transfer.
using SendProgress = std::function<bool(std::uint64_t sent, std::uint64_t total)>;

// Transport the pipeline streams through. Implementations report failures in the
// response values and never throw for ordinary network errors.
class IHttpClient
{
public:
    virtual ~IHttpClient() = default;

    virtual HeadResponse head(const std::string& url) = 0;

    // Streams the body of a GET into the sink; text stays empty.
    virtual HttpResponse streamGet(const std::string& url, const ChunkSink& sink) = 0;

    // Streams size bytes from body as a PUT; text carries the response body.
    virtual HttpResponse streamPut(const std::string& url, std::istream& body, std::uint64_t size,
                                   const std::string& contentType, const SendProgress& progress) = 0;
};

} // namespace sideload
