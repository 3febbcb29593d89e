#pragma once

namespace nodeward {

/**
 * Supervisor run state. Exactly one value at a time.
 *
 *   Stopped → Starting → Running → Stopping → Stopped
 *   Starting → Stopped            (spawn failed)
 *   Stopped → Updating → Stopped  (update finished either way)
 *   Running → Stopped             (process death seen by the liveness poll)
 */
enum class RunState {
    Stopped,
    Starting,
    Running,
    Stopping,
    Updating,
};

inline const char* to_string(RunState state) {
    switch (state) {
        case RunState::Stopped:  return "stopped";
        case RunState::Starting: return "starting";
        case RunState::Running:  return "running";
        case RunState::Stopping: return "stopping";
        case RunState::Updating: return "updating";
    }
    return "unknown";
}

/// True when `from → to` is one of the transitions listed above.
inline bool is_valid_transition(RunState from, RunState to) {
    switch (from) {
        case RunState::Stopped:
            return to == RunState::Starting || to == RunState::Updating;
        case RunState::Starting:
            return to == RunState::Running || to == RunState::Stopped;
        case RunState::Running:
            return to == RunState::Stopping || to == RunState::Stopped;
        case RunState::Stopping:
        case RunState::Updating:
            return to == RunState::Stopped;
    }
    return false;
}

}  // namespace nodeward
