#pragma once

#include <string>

namespace rcs::ims {

enum class TerminationReason {
    TERMINATION_BY_SYSTEM,
    TERMINATION_BY_USER,
    TERMINATION_BY_REMOTE,
    TERMINATION_BY_TIMEOUT,
    TERMINATION_BY_INACTIVITY,
    TERMINATION_BY_CONNECTION_LOST
};

inline std::string terminationReasonToString(TerminationReason reason) {
    switch (reason) {
        case TerminationReason::TERMINATION_BY_SYSTEM: return "TERMINATION_BY_SYSTEM";
        case TerminationReason::TERMINATION_BY_USER: return "TERMINATION_BY_USER";
        case TerminationReason::TERMINATION_BY_REMOTE: return "TERMINATION_BY_REMOTE";
        case TerminationReason::TERMINATION_BY_TIMEOUT: return "TERMINATION_BY_TIMEOUT";
        case TerminationReason::TERMINATION_BY_INACTIVITY: return "TERMINATION_BY_INACTIVITY";
        case TerminationReason::TERMINATION_BY_CONNECTION_LOST: return "TERMINATION_BY_CONNECTION_LOST";
    }
    return "UNKNOWN";
}

} // namespace rcs::ims
