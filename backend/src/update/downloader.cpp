/**
 * Downloader — talks to the release index and installs node binaries.
 *
 * Uses libcurl for every transfer. Binaries are written next to their final
 * location as `<name>.part` and only renamed into place once complete.
 */

#include "update/downloader.h"

#include <cstdio>
#include <memory>
#include <mutex>
#include <system_error>

#include <curl/curl.h>
#include <spdlog/spdlog.h>

#include "crypto/sha256.h"
#include "update/progress_throttle.h"

using json = nlohmann::json;

namespace nodeward {

namespace {

constexpr long kConnectTimeoutSeconds = 30;
// Abort when the transfer stalls below 1 byte/s for this long.
constexpr long kStallTimeoutSeconds = 60;

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;

CurlHandle make_handle(const std::string& url, const std::string& user_agent) {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });

    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) return curl;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, user_agent.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT, kConnectTimeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_LOW_SPEED_TIME, kStallTimeoutSeconds);
    return curl;
}

/// HTTP status, or 0 for schemes without one (file://).
long response_code(CURL* curl) {
    long code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &code);
    return code;
}

bool is_http_failure(long code) {
    return code != 0 && (code < 200 || code >= 300);
}

size_t append_to_string(char* data, size_t size, size_t nmemb, void* userp) {
    static_cast<std::string*>(userp)->append(data, size * nmemb);
    return size * nmemb;
}

struct TransferState {
    std::FILE*        file = nullptr;
    CURL*             curl = nullptr;
    Sha256            hasher;
    ProgressThrottle* throttle = nullptr;
    uint64_t          expected = 0;
    uint64_t          received = 0;
    bool              io_error = false;

    uint64_t total() const {
        if (expected > 0) return expected;
        curl_off_t length = -1;
        curl_easy_getinfo(curl, CURLINFO_CONTENT_LENGTH_DOWNLOAD_T, &length);
        return length > 0 ? static_cast<uint64_t>(length) : 0;
    }
};

size_t write_to_file(char* data, size_t size, size_t nmemb, void* userp) {
    auto* state = static_cast<TransferState*>(userp);
    size_t bytes = size * nmemb;
    if (std::fwrite(data, 1, bytes, state->file) != bytes) {
        state->io_error = true;
        return 0;  // makes curl abort with CURLE_WRITE_ERROR
    }
    state->hasher.update(data, bytes);
    state->received += bytes;
    state->throttle->update(state->received, state->total());
    return bytes;
}

void remove_quietly(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) spdlog::warn("[Downloader] Could not remove {}: {}", path.string(), ec.message());
}

}  // namespace

Downloader::Downloader(std::string index_url, std::string asset_name, std::string user_agent)
    : index_url_(std::move(index_url)),
      asset_name_(std::move(asset_name)),
      user_agent_(std::move(user_agent)) {}

Result<std::string> Downloader::http_get(const std::string& url) const {
    auto curl = make_handle(url, user_agent_);
    if (!curl) return Error{ErrorCode::NetworkError, "Failed to initialise HTTP client"};

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, append_to_string);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);

    CURLcode rc = curl_easy_perform(curl.get());
    if (rc != CURLE_OK) {
        return Error{ErrorCode::NetworkError,
                     std::string("Failed to fetch release info: ") + curl_easy_strerror(rc)};
    }
    long code = response_code(curl.get());
    if (is_http_failure(code)) {
        return Error{ErrorCode::NetworkError,
                     "Failed to fetch release information (HTTP " + std::to_string(code) + ")"};
    }
    return body;
}

Result<ReleaseInfo> Downloader::fetch_latest_release() const {
    spdlog::info("[Downloader] Querying {}", index_url_);

    auto body = http_get(index_url_);
    if (!body) return body.error();

    json release;
    try {
        release = json::parse(body.value());
    } catch (const json::exception& e) {
        return Error{ErrorCode::NetworkError,
                     std::string("Failed to parse release info: ") + e.what()};
    }
    return parse_release(release, asset_name_);
}

Result<ReleaseInfo> Downloader::parse_release(const json& release, const std::string& asset_name) {
    if (!release.is_object()) {
        return Error{ErrorCode::NoReleaseFound, "Release index returned no release"};
    }

    ReleaseInfo info;
    info.version = release.value("tag_name", "");
    if (info.version.empty()) {
        return Error{ErrorCode::NoReleaseFound, "Release index returned no release"};
    }

    auto assets = release.find("assets");
    if (assets != release.end() && assets->is_array()) {
        for (const auto& asset : *assets) {
            if (!asset.is_object() || asset.value("name", "") != asset_name) continue;
            info.asset_name = asset_name;
            info.url = asset.value("browser_download_url", "");
            auto size = asset.value("size", int64_t{0});
            info.size = size > 0 ? static_cast<uint64_t>(size) : 0;
            break;
        }
    }

    if (info.url.empty()) {
        return Error{ErrorCode::NoReleaseFound,
                     asset_name + " not found in release " + info.version};
    }
    return info;
}

Result<std::string> Downloader::download(const std::string& url,
                                         const std::filesystem::path& destination,
                                         uint64_t expected_size,
                                         const ProgressCallback& on_progress) const {
    std::error_code ec;
    if (destination.has_parent_path()) {
        std::filesystem::create_directories(destination.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IOError,
                         "Failed to create " + destination.parent_path().string() + ": " +
                             ec.message()};
        }
    }

    auto partial = destination;
    partial += ".part";

    auto curl = make_handle(url, user_agent_);
    if (!curl) return Error{ErrorCode::NetworkError, "Failed to initialise HTTP client"};

    TransferState state;
    state.file = std::fopen(partial.string().c_str(), "wb");
    if (!state.file) {
        return Error{ErrorCode::IOError, "Failed to open " + partial.string() + " for writing"};
    }

    ProgressThrottle throttle(kProgressInterval, on_progress);
    state.curl     = curl.get();
    state.throttle = &throttle;
    state.expected = expected_size;

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_file);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &state);

    spdlog::info("[Downloader] Downloading {} -> {}", url, destination.string());
    CURLcode rc = curl_easy_perform(curl.get());
    long code = response_code(curl.get());
    bool closed = std::fclose(state.file) == 0;
    state.file = nullptr;

    auto fail = [&](ErrorCode err, std::string message) -> Result<std::string> {
        remove_quietly(partial);
        spdlog::error("[Downloader] {}", message);
        return Error{err, std::move(message)};
    };

    if (state.io_error) {
        return fail(ErrorCode::IOError, "Failed to save executable: write to disk failed");
    }
    if (rc == CURLE_PARTIAL_FILE) {
        return fail(ErrorCode::IncompleteTransfer,
                    "Download interrupted after " + std::to_string(state.received) + " bytes");
    }
    if (rc != CURLE_OK) {
        return fail(ErrorCode::NetworkError,
                    std::string("Failed to download executable: ") + curl_easy_strerror(rc));
    }
    if (is_http_failure(code)) {
        return fail(ErrorCode::NetworkError,
                    "Failed to download executable (HTTP " + std::to_string(code) + ")");
    }
    if (!closed) {
        return fail(ErrorCode::IOError, "Failed to save executable: could not flush file");
    }
    if (expected_size > 0 && state.received < expected_size) {
        return fail(ErrorCode::IncompleteTransfer,
                    "Download incomplete: received " + std::to_string(state.received) + " of " +
                        std::to_string(expected_size) + " bytes");
    }

    throttle.finish(state.received, state.total());

#ifndef _WIN32
    std::filesystem::permissions(partial,
                                 std::filesystem::perms::owner_all |
                                     std::filesystem::perms::group_read |
                                     std::filesystem::perms::group_exec |
                                     std::filesystem::perms::others_read |
                                     std::filesystem::perms::others_exec,
                                 ec);
    if (ec) {
        return fail(ErrorCode::IOError,
                    "Failed to set executable permissions: " + ec.message());
    }
#endif

    std::filesystem::rename(partial, destination, ec);
    if (ec) {
        return fail(ErrorCode::IOError, "Failed to save executable: " + ec.message());
    }

    auto digest = state.hasher.hex_digest();
    spdlog::info("[Downloader] Installed {} ({} bytes, sha256 {})", destination.string(),
                 state.received, digest);
    return digest;
}

}  // namespace nodeward
