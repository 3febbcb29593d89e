/**
 * NodeConfig — validation and JSON mapping for a node run.
 */

#include "core/node_config.h"

#include <cctype>
#include <spdlog/fmt/fmt.h>

using json = nlohmann::json;

namespace nodeward {

namespace {

Status check_port(int port, const char* label) {
    if (port < NodeConfig::kMinPort || port > NodeConfig::kMaxPort) {
        return Error{ErrorCode::InvalidConfig,
                     fmt::format("Please enter a valid {} port ({}-{}).", label,
                                 NodeConfig::kMinPort, NodeConfig::kMaxPort)};
    }
    return Status::ok();
}

Result<int> port_from_json(const json& j, const char* key, const char* label) {
    auto invalid = Error{ErrorCode::InvalidConfig,
                         fmt::format("Please enter a valid {} port ({}-{}).", label,
                                     NodeConfig::kMinPort, NodeConfig::kMaxPort)};
    if (!j.contains(key)) return invalid;
    const auto& v = j.at(key);
    if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        if (n < NodeConfig::kMinPort || n > NodeConfig::kMaxPort) return invalid;
        return static_cast<int>(n);
    }
    // The UI hands over raw form text on some paths.
    if (v.is_string()) {
        auto text = trim(v.get<std::string>());
        if (text.empty() || text.size() > 5) return invalid;
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return invalid;
        }
        int n = std::stoi(text);
        if (n < NodeConfig::kMinPort || n > NodeConfig::kMaxPort) return invalid;
        return n;
    }
    return invalid;
}

}  // namespace

std::string trim(const std::string& s) {
    auto begin = s.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return {};
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(begin, end - begin + 1);
}

Status NodeConfig::validate() const {
    if (trim(db_path).empty()) {
        return Error{ErrorCode::InvalidConfig, "Database path is not set."};
    }
    if (auto s = check_port(api_port, "API"); !s) return s;
    return check_port(p2p_port, "P2P");
}

Result<NodeConfig> NodeConfig::from_json(const json& j) {
    if (!j.is_object()) {
        return Error{ErrorCode::InvalidConfig, "Node configuration must be an object."};
    }

    NodeConfig config;
    if (j.contains("dbPath") && j.at("dbPath").is_string()) {
        config.db_path = trim(j.at("dbPath").get<std::string>());
    }
    if (config.db_path.empty()) {
        return Error{ErrorCode::InvalidConfig, "Database path is not set."};
    }

    auto api = port_from_json(j, "apiPort", "API");
    if (!api) return api.error();
    auto p2p = port_from_json(j, "p2pPort", "P2P");
    if (!p2p) return p2p.error();

    config.api_port = api.value();
    config.p2p_port = p2p.value();
    return config;
}

json NodeConfig::to_json() const {
    return {{"dbPath", db_path}, {"apiPort", api_port}, {"p2pPort", p2p_port}};
}

}  // namespace nodeward
