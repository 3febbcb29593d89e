#pragma once

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

#include "core/result.h"

namespace nodeward {

/**
 * Persists the user's chosen data directory across daemon restarts.
 *
 * Stored as `{ "data_path": "..." }` at `settings_path`.
 */
class SettingsStore {
public:
    SettingsStore(std::filesystem::path settings_path, std::filesystem::path default_data_path);

    [[nodiscard]] std::filesystem::path default_data_path() const { return default_data_path_; }

    /// The persisted choice, or the default when none was made.
    [[nodiscard]] std::filesystem::path current_data_path() const;

    /// Creates the directory and writes the settings file.
    Status set_custom_data_path(const std::string& path);

private:
    void load();
    Status save_locked() const;

    std::filesystem::path settings_path_;
    std::filesystem::path default_data_path_;

    mutable std::mutex                   mutex_;
    std::optional<std::filesystem::path> custom_data_path_;
};

}  // namespace nodeward
