#include "HttpClient.hpp"

#include <cpr/cpr.h>

namespace
{

inline void apply_common(cpr::Session& s, const updater::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
    s.SetUserAgent(cpr::UserAgent{ cfg.user_agent });
    s.SetRedirect(cpr::Redirect{ true });
}

inline cpr::Header make_header(const std::vector<updater::Header>& headers)
{
    cpr::Header h;
    for (auto& kv : headers)
    {
        h.emplace(kv.name, kv.value);
    }
    return h;
}

} // namespace

namespace updater
{

CprHttpClient::CprHttpClient(SessionConfig cfg)
    : cfg_(std::move(cfg))
{
}

HttpResponse CprHttpClient::get(const std::string& url, const std::vector<Header>& headers)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(headers));
    apply_common(s, cfg_);
    auto r = s.Get();
    HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    hr.text = std::move(r.text);
    return hr;
}

HttpResponse CprHttpClient::download(const std::string& url, std::ofstream& out)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    apply_common(s, cfg_);
    auto r = s.Download(out);
    HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    return hr;
}

} // namespace updater
