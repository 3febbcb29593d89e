#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "core/result.h"

namespace nodeward {

/**
 * What was last installed into a data directory, kept beside the binary as
 * `openhash.install.json`.
 */
struct InstallRecord {
    std::string version;
    std::string sha256;
    std::string installed_at;  ///< UTC, ISO 8601

    static std::filesystem::path path_for(const std::filesystem::path& db_path);

    static std::optional<InstallRecord> read(const std::filesystem::path& db_path);
    Status write(const std::filesystem::path& db_path) const;
};

}  // namespace nodeward
