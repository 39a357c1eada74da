#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <nlohmann/json.hpp>
#include "core/errors/exec_errors.hpp"

namespace snipexec::session {

// Per-session state. Empty today; reserved for context that should survive
// between executions of one session (variable bindings, history, ...).
struct SessionRecord {
    std::string session_id;
    nlohmann::json state = nlohmann::json::object();
};

// Thread-safe map of live sessions. One global lock guards the map; it is
// never held while a snippet runs.
class SessionRegistry {
public:
    // Registers an empty record under `requested_id`, or under a fresh id
    // when none (or an empty one) is given. Opening an id that is already
    // live is a Session error.
    core::errors::Result<std::string> open(
        const std::optional<std::string>& requested_id = std::nullopt);

    // Removes the record. Unknown or already closed ids are a no-op; the
    // return value tells whether anything was removed.
    bool close(const std::string& session_id);

    core::errors::Result<SessionRecord> lookup(const std::string& session_id) const;

    std::size_t session_count() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, SessionRecord> sessions_;
};

}  // namespace snipexec::session
