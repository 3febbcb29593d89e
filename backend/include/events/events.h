#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/result.h"
#include "core/run_state.h"

namespace nodeward {

struct StatusChanged {
    RunState state;
};

/**
 * Byte counts for one download. `bytes_total == 0` means the size is unknown.
 */
struct DownloadProgress {
    uint64_t bytes_received = 0;
    uint64_t bytes_total    = 0;

    /// Whole percent, or nullopt when the total is unknown.
    [[nodiscard]] std::optional<int> percent() const {
        if (bytes_total == 0) return std::nullopt;
        auto received = bytes_received > bytes_total ? bytes_total : bytes_received;
        return static_cast<int>((received * 100) / bytes_total);
    }
};

struct DownloadComplete {
    std::string version;
    std::string sha256;
};

struct DownloadFailed {
    ErrorCode   code;
    std::string reason;
};

}  // namespace nodeward
