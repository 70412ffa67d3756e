#include "CprHttpClient.hpp"

#include <cpr/cpr.h>
#include <plog/Log.h>

#include <istream>
#include <string_view>
#include <utility>

namespace
{

void apply_common(cpr::Session& s, const HttpSettings& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    if (cfg.low_speed_timeout_s > 0)
        s.SetLowSpeed(cpr::LowSpeed{ 1, cfg.low_speed_timeout_s });
    s.SetRedirect(cpr::Redirect{ 10L });
}

cpr::Header make_header(const HttpSettings& cfg, const std::string& contentType = {})
{
    cpr::Header h;
    h.emplace("User-Agent", cfg.user_agent);
    if (!contentType.empty())
        h.emplace("Content-Type", contentType);
    return h;
}

} // namespace

CprHttpClient::CprHttpClient(HttpSettings settings)
    : settings_(std::move(settings))
{
}

sideload::HeadResponse CprHttpClient::head(const std::string& url)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(settings_));
    apply_common(s, settings_);

    auto r = s.Head();
    sideload::HeadResponse hr;
    if (r.error)
    {
        hr.error = r.error.message;
        return hr;
    }

    hr.status_code = static_cast<int>(r.status_code);
    auto it = r.header.find("content-length");
    if (it != r.header.end())
    {
        try
        {
            hr.content_length = std::stoull(it->second);
        }
        catch (const std::exception& ex)
        {
            PLOG_DEBUG << "Ignoring malformed Content-Length '" << it->second << "': " << ex.what();
        }
    }
    return hr;
}

sideload::HttpResponse CprHttpClient::streamGet(const std::string& url, const sideload::ChunkSink& sink)
{
    bool aborted = false;

    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(settings_));
    apply_common(s, settings_);
    s.SetWriteCallback(cpr::WriteCallback{ [&](std::string_view data, intptr_t) -> bool {
        if (!sink(data.data(), data.size()))
        {
            aborted = true;
            return false;
        }
        return true;
    } });

    auto r = s.Get();
    sideload::HttpResponse hr;
    hr.aborted = aborted;
    hr.status_code = static_cast<int>(r.status_code);
    if (r.error && !aborted)
        hr.error = r.error.message;
    return hr;
}

sideload::HttpResponse CprHttpClient::streamPut(const std::string& url, std::istream& body, std::uint64_t size,
                                                const std::string& contentType,
                                                const sideload::SendProgress& progress)
{
    bool aborted = false;

    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(settings_, contentType));
    apply_common(s, settings_);
    s.SetReadCallback(cpr::ReadCallback{ static_cast<cpr::cpr_off_t>(size),
                                         [&body](char* buffer, size_t& length, intptr_t) -> bool {
                                             body.read(buffer, static_cast<std::streamsize>(length));
                                             length = static_cast<size_t>(body.gcount());
                                             return !body.bad();
                                         } });
    if (progress)
    {
        s.SetProgressCallback(cpr::ProgressCallback{
            [&](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t uploadNow,
                intptr_t) -> bool {
                if (!progress(static_cast<std::uint64_t>(uploadNow), size))
                {
                    aborted = true;
                    return false;
                }
                return true;
            } });
    }

    auto r = s.Put();
    sideload::HttpResponse hr;
    hr.aborted = aborted;
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    if (r.error && !aborted)
        hr.error = r.error.message;
    return hr;
}
