#include <catch2/catch.hpp>

#include <vector>

#include "crypto/sha256.h"
#include "test_helpers.h"
#include "update/downloader.h"

namespace downloader_tests {

using namespace nodeward;
using namespace nodeward::test;
using json = nlohmann::json;

constexpr uint64_t kFullSize = 1048576;

Downloader make_downloader(const std::string& index_url) {
    return Downloader(index_url, "openhash", "nodeward-tests");
}

std::string payload(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) data[i] = static_cast<char>(i * 31 % 251);
    return data;
}

TEST_CASE("Release parsing picks the configured asset", "[update][release]") {
    json release = {
        {"tag_name", "v1.4.0"},
        {"assets",
         {{{"name", "openhash.exe"}, {"browser_download_url", "https://x/openhash.exe"}, {"size", 10}},
          {{"name", "openhash"}, {"browser_download_url", "https://x/openhash"}, {"size", 20}}}},
    };

    auto info = Downloader::parse_release(release, "openhash");
    REQUIRE(info.is_ok());
    CHECK(info.value().version == "v1.4.0");
    CHECK(info.value().url == "https://x/openhash");
    CHECK(info.value().size == 20);
}

TEST_CASE("Release parsing reports missing releases and assets", "[update][release]") {
    auto no_tag = Downloader::parse_release(json{{"assets", json::array()}}, "openhash");
    REQUIRE_FALSE(no_tag.is_ok());
    CHECK(no_tag.error().code == ErrorCode::NoReleaseFound);

    auto no_asset = Downloader::parse_release(
        json{{"tag_name", "v2"}, {"assets", {{{"name", "other"}, {"browser_download_url", "u"}}}}},
        "openhash");
    REQUIRE_FALSE(no_asset.is_ok());
    CHECK(no_asset.error().code == ErrorCode::NoReleaseFound);
    CHECK(no_asset.error().message == "openhash not found in release v2");
}

TEST_CASE("Fetching the latest release reads the index", "[update][release]") {
    TempDir dir;
    write_file(dir.path() / "latest.json",
               json{{"tag_name", "v3.0.1"},
                    {"assets", {{{"name", "openhash"},
                                 {"browser_download_url", "file:///srv/openhash"},
                                 {"size", 4096}}}}}
                   .dump());

    auto info = make_downloader(file_url(dir.path() / "latest.json")).fetch_latest_release();
    REQUIRE(info.is_ok());
    CHECK(info.value().version == "v3.0.1");
    CHECK(info.value().size == 4096);
}

TEST_CASE("Fetching from an unreachable index is a network error", "[update][release]") {
    TempDir dir;
    auto missing = make_downloader(file_url(dir.path() / "nope.json")).fetch_latest_release();
    REQUIRE_FALSE(missing.is_ok());
    CHECK(missing.error().code == ErrorCode::NetworkError);

    write_file(dir.path() / "garbage.json", "<html>rate limited</html>");
    auto garbage = make_downloader(file_url(dir.path() / "garbage.json")).fetch_latest_release();
    REQUIRE_FALSE(garbage.is_ok());
    CHECK(garbage.error().code == ErrorCode::NetworkError);
}

TEST_CASE("Download installs an executable binary", "[update][download]") {
    TempDir dir;
    auto source = dir.path() / "release.bin";
    write_file(source, payload(kFullSize));
    auto destination = dir.path() / "node" / "openhash";

    std::vector<DownloadProgress> progress;
    auto result = make_downloader("unused").download(
        file_url(source), destination, kFullSize,
        [&](const DownloadProgress& p) { progress.push_back(p); });

    REQUIRE(result.is_ok());
    CHECK(result.value() == Sha256::of_file(source).value());
    CHECK(std::filesystem::file_size(destination) == kFullSize);
    CHECK_FALSE(std::filesystem::exists(dir.path() / "node" / "openhash.part"));

    auto perms = std::filesystem::status(destination).permissions();
    CHECK((perms & std::filesystem::perms::owner_exec) != std::filesystem::perms::none);

    REQUIRE_FALSE(progress.empty());
    for (std::size_t i = 1; i < progress.size(); ++i) {
        CHECK(progress[i].bytes_received > progress[i - 1].bytes_received);
    }
    CHECK(progress.back().bytes_received == kFullSize);
    CHECK(progress.back().bytes_total == kFullSize);
}

TEST_CASE("An interrupted download leaves no partial binary", "[update][download]") {
    TempDir dir;
    auto source = dir.path() / "truncated.bin";
    write_file(source, payload(500000));
    auto destination = dir.path() / "openhash";

    uint64_t last = 0;
    auto result = make_downloader("unused").download(
        file_url(source), destination, kFullSize,
        [&](const DownloadProgress& p) {
            CHECK(p.bytes_received >= last);
            last = p.bytes_received;
        });

    REQUIRE_FALSE(result.is_ok());
    CHECK(result.error().code == ErrorCode::IncompleteTransfer);
    CHECK(result.error().kind() == ErrorKind::Transfer);
    CHECK_FALSE(std::filesystem::exists(destination));
    CHECK_FALSE(std::filesystem::exists(dir.path() / "openhash.part"));
}

TEST_CASE("A failed download keeps the previous binary", "[update][download]") {
    TempDir dir;
    auto destination = dir.path() / "openhash";
    write_file(destination, "previous build");

    auto result = make_downloader("unused").download(file_url(dir.path() / "missing.bin"),
                                                     destination, 0, nullptr);

    REQUIRE_FALSE(result.is_ok());
    CHECK(result.error().code == ErrorCode::NetworkError);
    CHECK(read_file(destination) == "previous build");
    CHECK_FALSE(std::filesystem::exists(dir.path() / "openhash.part"));
}

TEST_CASE("Download of unknown size still completes", "[update][download]") {
    TempDir dir;
    auto source = dir.path() / "release.bin";
    write_file(source, payload(2048));
    auto destination = dir.path() / "openhash";
    write_file(destination, "old");

    auto result = make_downloader("unused").download(file_url(source), destination, 0, nullptr);
    REQUIRE(result.is_ok());
    CHECK(read_file(destination) == payload(2048));
}

TEST_CASE("Sha256 matches a known digest", "[crypto]") {
    Sha256 hasher;
    hasher.update("abc", 3);
    CHECK(hasher.hex_digest() ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

}  // namespace downloader_tests
