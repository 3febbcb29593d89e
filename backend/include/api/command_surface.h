#pragma once

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "api/event_journal.h"
#include "config/settings_store.h"
#include "node/supervisor.h"

namespace nodeward {

/**
 * The commands the UI can invoke, independent of transport.
 *
 * Every reply is `{"ok": true, "result": ...}` or
 * `{"ok": false, "error": "<message>", "kind": "<category>"}`.
 */
class CommandSurface {
public:
    CommandSurface(Supervisor& supervisor, SettingsStore& settings, EventJournal& journal);

    nlohmann::json invoke(const std::string& command, const nlohmann::json& args) const;

    [[nodiscard]] bool has_command(const std::string& command) const;
    [[nodiscard]] std::vector<std::string> command_names() const;

private:
    using Handler = std::function<nlohmann::json(const nlohmann::json& args)>;

    void register_commands();

    Supervisor&    supervisor_;
    SettingsStore& settings_;
    EventJournal&  journal_;

    std::map<std::string, Handler> handlers_;
};

}  // namespace nodeward
