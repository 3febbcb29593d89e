/**
 * SettingsStore — the single persisted record (selected data directory).
 */

#include "config/settings_store.h"

#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "core/node_config.h"

using json = nlohmann::json;

namespace nodeward {

SettingsStore::SettingsStore(std::filesystem::path settings_path,
                             std::filesystem::path default_data_path)
    : settings_path_(std::move(settings_path)), default_data_path_(std::move(default_data_path)) {
    load();
}

std::filesystem::path SettingsStore::current_data_path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return custom_data_path_.value_or(default_data_path_);
}

Status SettingsStore::set_custom_data_path(const std::string& path) {
    auto trimmed = trim(path);
    if (trimmed.empty()) {
        return Error{ErrorCode::InvalidConfig, "Data path must not be empty."};
    }

    std::error_code ec;
    std::filesystem::create_directories(trimmed, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Failed to create data directory: " + ec.message()};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto previous = custom_data_path_;
    custom_data_path_ = std::filesystem::path(trimmed);
    if (auto s = save_locked(); !s) {
        custom_data_path_ = previous;
        return s;
    }
    spdlog::info("[Settings] Data path set to {}", trimmed);
    return Status::ok();
}

void SettingsStore::load() {
    std::ifstream file(settings_path_);
    if (!file.is_open()) return;

    try {
        auto j = json::parse(file);
        auto path = j.value("data_path", "");
        if (!trim(path).empty()) {
            custom_data_path_ = std::filesystem::path(trim(path));
            spdlog::info("[Settings] Using data path {}", custom_data_path_->string());
        }
    } catch (const json::exception& e) {
        spdlog::warn("[Settings] Ignoring unreadable {}: {}", settings_path_.string(), e.what());
    }
}

Status SettingsStore::save_locked() const {
    std::error_code ec;
    if (settings_path_.has_parent_path()) {
        std::filesystem::create_directories(settings_path_.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::IOError, "Failed to save settings: " + ec.message()};
        }
    }

    json j = {{"data_path", custom_data_path_ ? custom_data_path_->string() : ""}};
    auto tmp = settings_path_;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            return Error{ErrorCode::IOError, "Failed to save settings to " + tmp.string()};
        }
        out << j.dump(2) << '\n';
        if (!out.good()) {
            return Error{ErrorCode::IOError, "Failed to save settings to " + tmp.string()};
        }
    }
    std::filesystem::rename(tmp, settings_path_, ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Failed to save settings: " + ec.message()};
    }
    return Status::ok();
}

}  // namespace nodeward
