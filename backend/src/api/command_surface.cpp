/**
 * CommandSurface — maps UI command names onto Supervisor and SettingsStore.
 */

#include "api/command_surface.h"

#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace nodeward {

namespace {

json ok(json result = nullptr) {
    return {{"ok", true}, {"result", std::move(result)}};
}

json failure(const Error& error) {
    return {{"ok", false}, {"error", error.message}, {"kind", to_string(error.kind())}};
}

json from_status(const Status& status, json result = nullptr) {
    if (!status) return failure(status.error());
    return ok(std::move(result));
}

/// Reads a string argument; the UI sends `dbPath` but `db_path` is accepted too.
std::string string_arg(const json& args, const char* key, const char* alt = nullptr) {
    if (!args.is_object()) return {};
    for (const char* k : {key, alt}) {
        if (k == nullptr) continue;
        auto it = args.find(k);
        if (it != args.end() && it->is_string()) return it->get<std::string>();
    }
    return {};
}

}  // namespace

CommandSurface::CommandSurface(Supervisor& supervisor, SettingsStore& settings,
                               EventJournal& journal)
    : supervisor_(supervisor), settings_(settings), journal_(journal) {
    register_commands();
}

json CommandSurface::invoke(const std::string& command, const json& args) const {
    auto it = handlers_.find(command);
    if (it == handlers_.end()) {
        return {{"ok", false}, {"error", "Unknown command: " + command}, {"kind", "NotFoundError"}};
    }
    try {
        return it->second(args);
    } catch (const json::exception& e) {
        spdlog::warn("[CommandSurface] {}: bad arguments: {}", command, e.what());
        return failure(Error{ErrorCode::InvalidConfig, std::string("Invalid arguments: ") + e.what()});
    }
}

bool CommandSurface::has_command(const std::string& command) const {
    return handlers_.count(command) != 0;
}

std::vector<std::string> CommandSurface::command_names() const {
    std::vector<std::string> names;
    for (const auto& [name, _] : handlers_) names.push_back(name);
    return names;
}

void CommandSurface::register_commands() {
    handlers_["get_default_data_path"] = [this](const json&) {
        return ok(settings_.default_data_path().string());
    };
    handlers_["get_current_data_path"] = [this](const json&) {
        return ok(settings_.current_data_path().string());
    };
    handlers_["set_custom_data_path"] = [this](const json& args) {
        return from_status(settings_.set_custom_data_path(string_arg(args, "path")));
    };
    handlers_["check_executable_exists"] = [this](const json& args) {
        auto db_path = string_arg(args, "dbPath", "db_path");
        if (db_path.empty()) db_path = settings_.current_data_path().string();
        return ok(Supervisor::executable_exists(db_path));
    };
    handlers_["start_node"] = [this](const json& args) {
        const json& body = args.contains("config") ? args.at("config") : args;
        auto config = NodeConfig::from_json(body);
        if (!config) return failure(config.error());
        return from_status(supervisor_.start(config.value()), true);
    };
    handlers_["stop_node"] = [this](const json&) {
        return from_status(supervisor_.stop(), true);
    };
    handlers_["check_and_download_update"] = [this](const json& args) {
        auto db_path = string_arg(args, "dbPath", "db_path");
        if (db_path.empty()) db_path = settings_.current_data_path().string();
        return from_status(supervisor_.check_for_update(db_path));
    };
    handlers_["get_process_status"] = [this](const json&) {
        return ok(supervisor_.query_status() == RunState::Running);
    };
    handlers_["get_status"] = [this](const json&) {
        auto db_path = settings_.current_data_path();
        json installed = nullptr;
        if (auto record = Supervisor::installed_release(db_path)) {
            installed = {{"version", record->version},
                         {"sha256", record->sha256},
                         {"installed_at", record->installed_at}};
        }
        return ok({{"state", to_string(supervisor_.query_status())},
                   {"data_path", db_path.string()},
                   {"executable", Supervisor::executable_exists(db_path)},
                   {"installed", installed}});
    };
    handlers_["get_logs"] = [this](const json&) { return ok(supervisor_.logs_text()); };
    handlers_["clear_logs"] = [this](const json&) {
        supervisor_.clear_logs();
        return ok();
    };
    handlers_["get_events"] = [this](const json& args) {
        uint64_t after = args.is_object() ? args.value("after", uint64_t{0}) : 0;
        json events = json::array();
        for (const auto& e : journal_.since(after)) {
            events.push_back({{"seq", e.seq}, {"event", e.event}, {"payload", e.payload}});
        }
        return ok(std::move(events));
    };
}

}  // namespace nodeward
