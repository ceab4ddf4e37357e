#include "AssetDownloader.hpp"

#include <plog/Log.h>

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace updater
{

namespace
{

void removePartial(const fs::path& path)
{
    std::error_code ec;
    if (fs::remove(path, ec))
    {
        PLOG_DEBUG << "Removed partial download " << path.string();
    }
    else if (ec)
    {
        PLOG_WARNING << "Could not remove partial download " << path.string() << ": " << ec.message();
    }
}

} // namespace

AssetDownloader::AssetDownloader(IHttpClient& http)
    : http_(http)
{
}

bool AssetDownloader::selectAsset(const ReleaseDescriptor& release, const std::string& executableName,
                                  AssetDescriptor& outAsset, UpdateError& outError)
{
    for (const auto& asset : release.assets)
    {
        if (asset.name != executableName)
            continue;

        if (asset.downloadUrl.empty())
        {
            outError = UpdateError(UpdateErrorCode::AssetNotFound, "Matching asset has no download URL",
                                   "asset " + asset.name + " in release " + release.tag);
            return false;
        }
        outAsset = asset;
        return true;
    }

    outError = UpdateError(UpdateErrorCode::AssetNotFound, "No asset matches the running executable",
                           "looked for " + executableName + " in release " + release.tag + " (" +
                               std::to_string(release.assets.size()) + " assets)");
    return false;
}

bool AssetDownloader::download(const AssetDescriptor& asset, const fs::path& destPath,
                               const fs::path& permissionsFrom, UpdateError& outError)
{
    PLOG_INFO << "Downloading " << asset.name << " from " << asset.downloadUrl;

    HttpResponse response;
    {
        std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
        if (!out.is_open())
        {
            outError = UpdateError(UpdateErrorCode::Download, "Failed to create the staged binary",
                                   destPath.string());
            return false;
        }

        response = http_.download(asset.downloadUrl, out);
        out.flush();
        if (!out)
        {
            out.close();
            removePartial(destPath);
            outError = UpdateError(UpdateErrorCode::Download, "Failed to write the staged binary",
                                   destPath.string());
            return false;
        }
    }

    if (!response.error.empty() || response.status_code != 200)
    {
        removePartial(destPath);
        std::string detail = response.error.empty() ? "HTTP " + std::to_string(response.status_code)
                                                    : response.error;
        outError = UpdateError(UpdateErrorCode::Download, "Download failed", asset.downloadUrl + ": " + detail);
        return false;
    }

    std::error_code ec;
    if (!permissionsFrom.empty() && fs::exists(permissionsFrom, ec))
    {
        auto perms = fs::status(permissionsFrom, ec).permissions();
        if (!ec)
        {
            fs::permissions(destPath, perms, fs::perm_options::replace, ec);
        }
        if (ec)
        {
            removePartial(destPath);
            outError = UpdateError(UpdateErrorCode::Download, "Could not set permissions on the staged binary",
                                   ec.message());
            return false;
        }
    }

    PLOG_INFO << "Download completed: " << destPath.string();
    return true;
}

} // namespace updater
