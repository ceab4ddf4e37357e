#pragma once

#include "HttpClient.hpp"
#include "UpdateTypes.hpp"

#include <filesystem>

namespace updater
{

class AssetDownloader
{
public:
    explicit AssetDownloader(IHttpClient& http);

    // Finds the asset whose name equals `executableName` exactly
    static bool selectAsset(const ReleaseDescriptor& release, const std::string& executableName,
                            AssetDescriptor& outAsset, UpdateError& outError);

    // Streams the asset to `destPath`. On any failure the partial file is removed.
    // When `permissionsFrom` exists its permission bits are copied onto the staged file.
    bool download(const AssetDescriptor& asset, const std::filesystem::path& destPath,
                  const std::filesystem::path& permissionsFrom, UpdateError& outError);

private:
    IHttpClient& http_;
};

} // namespace updater
