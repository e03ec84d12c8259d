#pragma once

#include "message.hpp"

#include <rcs/core/error.hpp>

namespace rcs::sip {

// Outbound signaling plane. Implementations own the transport; failures are
// reported as PayloadError (message could not be built or encoded) or
// NetworkError (message could not be delivered).
class SipInterface {
public:
    virtual ~SipInterface() = default;

    virtual core::Result<void> sendRequest(const SipMessage& request) = 0;
    virtual core::Result<void> sendResponse(const SipMessage& response) = 0;
};

} // namespace rcs::sip
