#include "ReleaseClient.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;

namespace updater
{

namespace
{

// null, missing and non-string fields all read as empty
std::string stringField(const json& object, const char* key)
{
    auto it = object.find(key);
    if (it == object.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

bool readRelease(const json& entry, ReleaseDescriptor& outRelease)
{
    if (!entry.is_object())
        return false;

    outRelease.tag = stringField(entry, "tag_name");
    outRelease.assets.clear();

    auto it = entry.find("assets");
    if (it == entry.end() || !it->is_array())
        return true;

    for (const auto& asset : *it)
    {
        if (!asset.is_object())
            continue;

        AssetDescriptor descriptor;
        descriptor.name = stringField(asset, "name");
        descriptor.downloadUrl = stringField(asset, "browser_download_url");
        outRelease.assets.push_back(std::move(descriptor));
    }
    return true;
}

} // namespace

ReleaseClient::ReleaseClient(IHttpClient& http, std::string feedUrl, int maxRetries)
    : http_(http)
    , feed_url_(std::move(feedUrl))
    , max_retries_(maxRetries < 1 ? 1 : maxRetries)
{
}

std::string ReleaseClient::endpointFor(UpdateChannel channel) const
{
    if (channel == UpdateChannel::Stable)
        return feed_url_ + "/latest";
    return feed_url_;
}

bool ReleaseClient::fetchLatest(UpdateChannel channel, ReleaseDescriptor& outRelease, UpdateError& outError)
{
    if (channel == UpdateChannel::Unknown)
    {
        outError = UpdateError(UpdateErrorCode::EmptyFeed, "Update channel is disabled");
        return false;
    }

    const std::string url = endpointFor(channel);
    const std::vector<Header> headers = { { "Accept", "application/vnd.github+json" } };

    std::string body;
    std::string lastTransportError;
    for (int attempt = 1; attempt <= max_retries_ && body.empty(); ++attempt)
    {
        HttpResponse response = http_.get(url, headers);
        if (!response.error.empty())
        {
            lastTransportError = response.error;
            PLOG_DEBUG << "Release feed attempt " << attempt << " failed: " << response.error;
            continue;
        }
        if (!response.ok())
        {
            lastTransportError = "HTTP " + std::to_string(response.status_code);
            PLOG_DEBUG << "Release feed attempt " << attempt << " returned status " << response.status_code;
            continue;
        }
        body = std::move(response.text);
    }

    if (body.empty())
    {
        outError = UpdateError(UpdateErrorCode::Network, "Could not check latest version",
                               url + " gave no content after " + std::to_string(max_retries_) + " attempts" +
                                   (lastTransportError.empty() ? "" : " (" + lastTransportError + ")"));
        return false;
    }

    return parseFeed(body, channel != UpdateChannel::Stable, outRelease, outError);
}

bool ReleaseClient::parseFeed(const std::string& body, bool isList, ReleaseDescriptor& outRelease,
                              UpdateError& outError)
{
    try
    {
        json doc = json::parse(body);
        ReleaseDescriptor release;

        if (isList)
        {
            if (!doc.is_array())
            {
                outError = UpdateError(UpdateErrorCode::Parse, "Release list has an unexpected shape",
                                       std::string("expected array, got ") + doc.type_name());
                return false;
            }
            if (doc.empty())
            {
                outError = UpdateError(UpdateErrorCode::EmptyFeed, "Release list is empty");
                return false;
            }
            if (!readRelease(doc.front(), release))
            {
                outError = UpdateError(UpdateErrorCode::Parse, "Release entry is not an object");
                return false;
            }
        }
        else if (!readRelease(doc, release))
        {
            outError = UpdateError(UpdateErrorCode::Parse, "Release has an unexpected shape",
                                   std::string("expected object, got ") + doc.type_name());
            return false;
        }

        if (release.tag.empty())
        {
            outError = UpdateError(UpdateErrorCode::EmptyFeed, "Release has no tag");
            return false;
        }

        outRelease = std::move(release);
        return true;
    }
    catch (const json::exception& e)
    {
        outError = UpdateError(UpdateErrorCode::Parse, "Could not parse release feed", e.what());
        PLOG_WARNING << outError.message << ": " << e.what();
        return false;
    }
}

} // namespace updater
