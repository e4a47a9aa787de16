#include "chunkvault/metadata/session_store.h"

namespace chunkvault::metadata {

const char* SessionStateName(SessionState state) {
    switch (state) {
        case SessionState::kPending:
            return "pending";
        case SessionState::kInProgress:
            return "in_progress";
        case SessionState::kComplete:
            return "complete";
        case SessionState::kFailed:
            return "failed";
        case SessionState::kExpired:
            return "expired";
    }
    return "failed";
}

SessionState ParseSessionState(const std::string& name) {
    if (name == "pending") {
        return SessionState::kPending;
    }
    if (name == "in_progress") {
        return SessionState::kInProgress;
    }
    if (name == "complete") {
        return SessionState::kComplete;
    }
    if (name == "expired") {
        return SessionState::kExpired;
    }
    return SessionState::kFailed;
}

bool IsTerminal(SessionState state) {
    return state == SessionState::kComplete || state == SessionState::kFailed ||
           state == SessionState::kExpired;
}

}  // namespace chunkvault::metadata
