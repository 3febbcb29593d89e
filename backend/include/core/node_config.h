#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

#include "core/result.h"

namespace nodeward {

/**
 * Arguments for one run of the worker process.
 */
struct NodeConfig {
    std::string db_path;
    int         api_port = 0;
    int         p2p_port = 0;

    static constexpr int kMinPort = 1;
    static constexpr int kMaxPort = 65535;

    /// Checks port ranges and a non-blank db_path. Message is user-facing.
    [[nodiscard]] Status validate() const;

    /// Parses the `{dbPath, apiPort, p2pPort}` object the UI sends.
    /// Missing or non-integer fields are reported as InvalidConfig.
    static Result<NodeConfig> from_json(const nlohmann::json& j);

    [[nodiscard]] nlohmann::json to_json() const;
};

/// Strips leading and trailing whitespace.
std::string trim(const std::string& s);

}  // namespace nodeward
