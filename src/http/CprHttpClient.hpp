#pragma once

#include "sideload/http/IHttpClient.hpp"

#include <string>

struct HttpSettings
{
    int connect_timeout_ms = 10000;
    int low_speed_timeout_s = 30; // Abort when under 1 byte/s for this long, 0 disables
    std::string user_agent = "sideload";
};

// libcurl transport through cpr. Bodies are streamed in both directions and
// never held in memory whole.
class CprHttpClient : public sideload::IHttpClient
{
public:
    explicit CprHttpClient(HttpSettings settings = {});

    sideload::HeadResponse head(const std::string& url) override;
    sideload::HttpResponse streamGet(const std::string& url, const sideload::ChunkSink& sink) override;
    sideload::HttpResponse streamPut(const std::string& url, std::istream& body, std::uint64_t size,
                                     const std::string& contentType, const sideload::SendProgress& progress) override;

private:
    HttpSettings settings_;
};
