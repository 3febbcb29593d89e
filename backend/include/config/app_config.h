#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace nodeward {

/**
 * Daemon settings read from config.json. Every field has a default, so a
 * missing file yields a usable configuration.
 */
struct AppConfig {
    uint16_t    api_port          = 7420;
    std::string release_index_url =
        "https://api.github.com/repos/nnlgsakib/open-hash-db/releases/latest";
    std::string asset_name;
    std::string log_level = "info";

    std::chrono::milliseconds terminate_grace{5000};
    std::chrono::milliseconds poll_interval{5000};

    std::filesystem::path settings_path;
    std::filesystem::path default_data_path;

    AppConfig();

    /// Overlays the keys present in `j` onto the defaults. nullopt when a
    /// numeric setting is out of range.
    static std::optional<AppConfig> from_json(const nlohmann::json& j);

    /// nullopt when the file exists but cannot be parsed or is out of range.
    static std::optional<AppConfig> load(const std::filesystem::path& path);
};

/// `$XDG_CONFIG_HOME` / `%APPDATA%` / `~/.config`, suffixed with `nodeward`.
std::filesystem::path user_config_dir();

/// `$XDG_DATA_HOME` / `%LOCALAPPDATA%` / `~/.local/share`, suffixed with `nodeward`.
std::filesystem::path user_data_dir();

}  // namespace nodeward
