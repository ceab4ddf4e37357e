#pragma once

#include <fstream>
#include <string>
#include <utility>
#include <vector>

namespace updater
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 5000;
    int timeout_ms = 60000;
    std::string user_agent = "steward-updater";
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }
};

// Transport used by the release feed and the asset download
class IHttpClient
{
public:
    virtual ~IHttpClient() = default;

    // GET returning the body in HttpResponse::text
    virtual HttpResponse get(const std::string& url, const std::vector<Header>& headers) = 0;

    // GET streaming the body into `out`; HttpResponse::text stays empty
    virtual HttpResponse download(const std::string& url, std::ofstream& out) = 0;
};

// libcurl-backed client (via cpr)
class CprHttpClient : public IHttpClient
{
public:
    explicit CprHttpClient(SessionConfig cfg = {});

    HttpResponse get(const std::string& url, const std::vector<Header>& headers) override;
    HttpResponse download(const std::string& url, std::ofstream& out) override;

private:
    SessionConfig cfg_;
};

} // namespace updater
