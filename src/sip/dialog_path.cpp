#include "rcs/sip/dialog_path.hpp"
#include "rcs/core/logger.hpp"

namespace rcs::sip {

DialogPath::DialogPath(std::string call_id,
                       std::string local_party,
                       std::string remote_party,
                       std::string local_tag,
                       std::string remote_tag,
                       uint32_t local_cseq)
    : call_id_(std::move(call_id))
    , local_party_(std::move(local_party))
    , remote_party_(std::move(remote_party))
    , local_tag_(std::move(local_tag))
    , remote_tag_(std::move(remote_tag))
    , target_(remote_party_)
    , local_cseq_(local_cseq) {
}

DialogPath DialogPath::fromIncomingRequest(const SipMessage& request, const std::string& local_tag) {
    const SipHeaders& headers = request.getHeaders();

    DialogPath path(headers.getCallId(),
                    extractAddress(headers.getTo()),
                    extractAddress(headers.getFrom()),
                    local_tag,
                    extractTag(headers.getFrom()));

    // Remote target is the Contact header or the Request-URI
    std::string contact = headers.get("Contact");
    path.setTarget(contact.empty() ? request.getRequestUri() : extractAddress(contact));
    return path;
}

bool DialogPath::matches(const SipMessage& message) const {
    return message.getCallId() == call_id_;
}

SipMessage DialogPath::createBye() {
    SipMessage bye(SipMethod::BYE, target_);

    SipHeaders& headers = bye.getHeaders();
    headers.setCallId(call_id_);
    headers.setFrom("<" + local_party_ + ">;tag=" + local_tag_);
    headers.setTo("<" + remote_party_ + ">" + (remote_tag_.empty() ? "" : ";tag=" + remote_tag_));
    headers.setCSeq(++local_cseq_, methodToString(SipMethod::BYE));

    core::Logger::debug("Created BYE for dialog {} (CSeq {})", call_id_, local_cseq_);
    return bye;
}

SipMessage DialogPath::createResponse(const SipMessage& request, SipResponseCode code) const {
    SipMessage response(code);

    const SipHeaders& in = request.getHeaders();
    SipHeaders& out = response.getHeaders();
    for (const auto& [name, value] : in.getAll()) {
        if (name == "Via") {
            out.add(name, value);
        }
    }
    out.setFrom(in.getFrom());
    out.setCallId(in.getCallId());
    out.set("CSeq", in.getCSeq());

    // Final responses carry our tag in To
    std::string to = in.getTo();
    if (static_cast<int>(code) >= 200 && extractTag(to).empty()) {
        to += ";tag=" + local_tag_;
    }
    out.setTo(to);

    return response;
}

} // namespace rcs::sip
