#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/result.h"
#include "events/events.h"

namespace nodeward {

/// One downloadable build from the release index.
struct ReleaseInfo {
    std::string version;
    std::string asset_name;
    std::string url;
    uint64_t    size = 0;  ///< 0 when the index does not report it
};

/**
 * Release index client and binary fetcher.
 *
 * All transfers use libcurl, so `file://` URLs work alongside HTTP(S).
 */
class Downloader {
public:
    using ProgressCallback = std::function<void(const DownloadProgress&)>;

    static constexpr std::chrono::milliseconds kProgressInterval{100};

    Downloader(std::string index_url, std::string asset_name, std::string user_agent);

    /// Queries the index for the newest release carrying our asset.
    Result<ReleaseInfo> fetch_latest_release() const;

    /**
     * Streams `url` into `<destination>.part`, then renames it over
     * `destination` and marks it executable. Returns the SHA-256 of the
     * installed file. On failure the partial file is removed and
     * `destination` is left untouched.
     *
     * @param expected_size  0 if unknown; otherwise a short transfer fails
     *                       with IncompleteTransfer.
     */
    Result<std::string> download(const std::string& url,
                                 const std::filesystem::path& destination,
                                 uint64_t expected_size,
                                 const ProgressCallback& on_progress) const;

    /// Picks `asset_name` out of a GitHub-style `releases/latest` document.
    static Result<ReleaseInfo> parse_release(const nlohmann::json& release,
                                             const std::string& asset_name);

private:
    /// GET `url` into a string. Non-2xx HTTP status is a NetworkError.
    Result<std::string> http_get(const std::string& url) const;

    std::string index_url_;
    std::string asset_name_;
    std::string user_agent_;
};

}  // namespace nodeward
