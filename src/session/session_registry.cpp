#include "session/session_registry.hpp"
#include <utility>
#include "core/config/session_id.hpp"
#include "core/logging/logger.hpp"

namespace snipexec::session {

using core::errors::ErrorCategory;
using core::errors::ExecError;

core::errors::Result<std::string> SessionRegistry::open(
    const std::optional<std::string>& requested_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (requested_id.has_value() && !requested_id->empty()) {
        const std::string& session_id = *requested_id;
        if (sessions_.find(session_id) != sessions_.end()) {
            return ExecError{ErrorCategory::Session,
                             "Session is already open: " + session_id,
                             "session_already_open",
                             "Release the session first or omit the id."};
        }
        SessionRecord record;
        record.session_id = session_id;
        sessions_.emplace(session_id, std::move(record));
        LOG_INFO("SessionRegistry: opened " + session_id);
        return session_id;
    }

    constexpr int kMaxAttempts = 16;
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        const std::string session_id = core::config::generate_session_id();
        if (sessions_.find(session_id) != sessions_.end()) {
            continue;
        }

        SessionRecord record;
        record.session_id = session_id;
        sessions_.emplace(session_id, std::move(record));
        LOG_INFO("SessionRegistry: opened " + session_id);
        return session_id;
    }

    return ExecError{ErrorCategory::Internal,
                     "Unable to allocate unique session ID.",
                     "session_id_generation_failed"};
}

bool SessionRegistry::close(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    const bool removed = sessions_.erase(session_id) > 0;
    if (removed) {
        LOG_INFO("SessionRegistry: closed " + session_id);
    } else {
        LOG_DEBUG("SessionRegistry: close of unknown session " + session_id);
    }
    return removed;
}

core::errors::Result<SessionRecord> SessionRegistry::lookup(
    const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return ExecError{ErrorCategory::Session,
                         "Session ID not found: " + session_id,
                         "session_not_found"};
    }
    return it->second;
}

std::size_t SessionRegistry::session_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

}  // namespace snipexec::session
