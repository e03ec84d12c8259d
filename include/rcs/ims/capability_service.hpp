#pragma once

#include <rcs/content/contact_id.hpp>
#include <rcs/core/error.hpp>

namespace rcs::ims {

// Tracks the features supported by remote parties
class CapabilityService {
public:
    virtual ~CapabilityService() = default;

    // Queues a capability query towards the contact; completion is reported
    // through the capability service's own observers
    virtual core::Result<void> requestContactCapabilities(const content::ContactId& contact) = 0;
};

} // namespace rcs::ims
