#include "update/install_record.h"

#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace nodeward {

std::filesystem::path InstallRecord::path_for(const std::filesystem::path& db_path) {
    return db_path / "openhash.install.json";
}

std::optional<InstallRecord> InstallRecord::read(const std::filesystem::path& db_path) {
    std::ifstream file(path_for(db_path));
    if (!file.is_open()) return std::nullopt;

    try {
        auto j = json::parse(file);
        InstallRecord record;
        record.version      = j.value("version", "");
        record.sha256       = j.value("sha256", "");
        record.installed_at = j.value("installed_at", "");
        return record;
    } catch (const json::exception& e) {
        spdlog::warn("[InstallRecord] Unreadable {}: {}", path_for(db_path).string(), e.what());
        return std::nullopt;
    }
}

Status InstallRecord::write(const std::filesystem::path& db_path) const {
    json j = {{"version", version}, {"sha256", sha256}, {"installed_at", installed_at}};
    std::ofstream out(path_for(db_path), std::ios::trunc);
    if (!out.is_open()) {
        return Error{ErrorCode::IOError, "Failed to write " + path_for(db_path).string()};
    }
    out << j.dump(2) << '\n';
    if (!out.good()) {
        return Error{ErrorCode::IOError, "Failed to write " + path_for(db_path).string()};
    }
    return Status::ok();
}

}  // namespace nodeward
