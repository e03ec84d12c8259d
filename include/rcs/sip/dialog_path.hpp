#pragma once

#include "message.hpp"

#include <string>

namespace rcs::sip {

// Identification of an established SIP dialog (RFC 3261 Section 12)
// and the requests/responses a session sends inside it. Not synchronized;
// the owning session serializes access.
class DialogPath {
public:
    DialogPath(std::string call_id,
               std::string local_party,
               std::string remote_party,
               std::string local_tag,
               std::string remote_tag,
               uint32_t local_cseq = 1);

    // Builds the dialog from the request that created it, as seen by the recipient
    static DialogPath fromIncomingRequest(const SipMessage& request, const std::string& local_tag);

    const std::string& getCallId() const { return call_id_; }
    const std::string& getLocalParty() const { return local_party_; }
    const std::string& getRemoteParty() const { return remote_party_; }
    const std::string& getLocalTag() const { return local_tag_; }
    const std::string& getRemoteTag() const { return remote_tag_; }
    const std::string& getTarget() const { return target_; }
    uint32_t getLocalCSeq() const { return local_cseq_; }

    void setTarget(const std::string& target) { target_ = target; }

    bool isSigEstablished() const { return !remote_tag_.empty(); }

    // True when the message carries this dialog's Call-ID
    bool matches(const SipMessage& message) const;

    SipMessage createBye();
    SipMessage createResponse(const SipMessage& request, SipResponseCode code) const;

private:
    std::string call_id_;
    std::string local_party_;
    std::string remote_party_;
    std::string local_tag_;
    std::string remote_tag_;
    std::string target_;
    uint32_t local_cseq_;
};

} // namespace rcs::sip
