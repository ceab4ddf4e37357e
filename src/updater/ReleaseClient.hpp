#pragma once

#include "HttpClient.hpp"
#include "UpdateTypes.hpp"

#include <string>

namespace updater
{

// Release feed client.
//
// Stable reads "<feed>/latest" (one object), every other enabled channel reads the bare
// feed (a list) and keeps its first entry. An empty body is refetched up to maxRetries.
class ReleaseClient
{
public:
    ReleaseClient(IHttpClient& http, std::string feedUrl, int maxRetries = 5);

    bool fetchLatest(UpdateChannel channel, ReleaseDescriptor& outRelease, UpdateError& outError);

    std::string endpointFor(UpdateChannel channel) const;

    // Parses a feed payload. `isList` selects the list shape used by non-stable channels.
    static bool parseFeed(const std::string& body, bool isList, ReleaseDescriptor& outRelease,
                          UpdateError& outError);

private:
    IHttpClient& http_;
    std::string feed_url_;
    int max_retries_;
};

} // namespace updater
