/**
 * AppConfig — loads the daemon's config.json.
 *
 * {
 *   "api_port": 7420,
 *   "release_index_url": "https://api.github.com/repos/.../releases/latest",
 *   "asset_name": "openhash",
 *   "terminate_grace_ms": 5000,
 *   "poll_interval_ms": 5000,
 *   "log_level": "info",
 *   "settings_path": "~/.config/nodeward/settings.json",
 *   "default_data_path": "~/.local/share/nodeward/data"
 * }
 */

#include "config/app_config.h"

#include <cstdlib>
#include <fstream>

#include <spdlog/spdlog.h>

#include "process/process_runner.h"

using json = nlohmann::json;

namespace nodeward {

namespace {

std::filesystem::path env_path(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') return {};
    return value;
}

std::filesystem::path home_dir() {
#ifdef _WIN32
    return env_path("USERPROFILE");
#else
    return env_path("HOME");
#endif
}

}  // namespace

std::filesystem::path user_config_dir() {
#ifdef _WIN32
    auto base = env_path("APPDATA");
#else
    auto base = env_path("XDG_CONFIG_HOME");
    if (base.empty()) base = home_dir() / ".config";
#endif
    return base / "nodeward";
}

std::filesystem::path user_data_dir() {
#ifdef _WIN32
    auto base = env_path("LOCALAPPDATA");
#else
    auto base = env_path("XDG_DATA_HOME");
    if (base.empty()) base = home_dir() / ".local" / "share";
#endif
    return base / "nodeward";
}

AppConfig::AppConfig()
    : asset_name(ProcessRunner::executable_name()),
      settings_path(user_config_dir() / "settings.json"),
      default_data_path(user_data_dir() / "data") {}

std::optional<AppConfig> AppConfig::from_json(const json& j) {
    AppConfig config;
    if (!j.is_object()) return config;

    config.release_index_url = j.value("release_index_url", config.release_index_url);
    config.asset_name        = j.value("asset_name", config.asset_name);
    config.log_level         = j.value("log_level", config.log_level);

    auto api_port = j.value("api_port", static_cast<int64_t>(config.api_port));
    if (api_port < 1 || api_port > 65535) {
        spdlog::error("Invalid config: api_port {} is outside 1-65535", api_port);
        return std::nullopt;
    }
    config.api_port = static_cast<uint16_t>(api_port);

    auto grace_ms = j.value("terminate_grace_ms", static_cast<int64_t>(config.terminate_grace.count()));
    if (grace_ms < 0) {
        spdlog::error("Invalid config: terminate_grace_ms must not be negative (got {})", grace_ms);
        return std::nullopt;
    }
    config.terminate_grace = std::chrono::milliseconds(grace_ms);

    auto poll_ms = j.value("poll_interval_ms", static_cast<int64_t>(config.poll_interval.count()));
    if (poll_ms < 1) {
        spdlog::error("Invalid config: poll_interval_ms must be at least 1 (got {})", poll_ms);
        return std::nullopt;
    }
    config.poll_interval = std::chrono::milliseconds(poll_ms);

    if (j.contains("settings_path")) {
        config.settings_path = j.at("settings_path").get<std::string>();
    }
    if (j.contains("default_data_path")) {
        config.default_data_path = j.at("default_data_path").get<std::string>();
    }
    return config;
}

std::optional<AppConfig> AppConfig::load(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        spdlog::warn("Cannot open config file {}, using defaults", path.string());
        return AppConfig{};
    }
    try {
        return from_json(json::parse(file));
    } catch (const json::exception& e) {
        spdlog::error("Invalid config file {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

}  // namespace nodeward
