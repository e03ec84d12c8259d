#pragma once

#include <string>
#include <vector>
#include <utility>

#include <rcs/core/error.hpp>

namespace rcs::sip {

enum class SipMethod {
    INVITE,
    ACK,
    BYE,
    CANCEL,
    OPTIONS,
    MESSAGE,
    UPDATE,
    UNKNOWN
};

enum class SipResponseCode {
    Trying = 100,
    Ringing = 180,
    SessionProgress = 183,

    OK = 200,
    Accepted = 202,

    BadRequest = 400,
    Forbidden = 403,
    NotFound = 404,
    RequestTimeout = 408,
    CallTransactionDoesNotExist = 481,
    BusyHere = 486,
    RequestTerminated = 487,

    ServerInternalError = 500,
    ServiceUnavailable = 503,

    Decline = 603
};

// Header store keeping insertion order; names compare case-insensitively
// and the compact forms (i, f, t, m, l, c) are expanded on insertion.
class SipHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    std::string get(const std::string& name) const;
    bool has(const std::string& name) const;
    void remove(const std::string& name);

    void setFrom(const std::string& from) { set("From", from); }
    void setTo(const std::string& to) { set("To", to); }
    void setCallId(const std::string& call_id) { set("Call-ID", call_id); }
    void setCSeq(uint32_t seq, const std::string& method) { set("CSeq", std::to_string(seq) + " " + method); }

    std::string getFrom() const { return get("From"); }
    std::string getTo() const { return get("To"); }
    std::string getCallId() const { return get("Call-ID"); }
    std::string getCSeq() const { return get("CSeq"); }
    uint32_t getCSeqNumber() const;

    const std::vector<std::pair<std::string, std::string>>& getAll() const { return fields_; }

    static std::string canonicalName(const std::string& name);

private:
    std::vector<std::pair<std::string, std::string>> fields_;
};

class SipMessage {
public:
    SipMessage() = default;

    // Request constructor
    SipMessage(SipMethod method, std::string request_uri);

    // Response constructor
    SipMessage(SipResponseCode code, const std::string& reason_phrase = "");

    bool isRequest() const { return is_request_; }
    bool isResponse() const { return !is_request_; }

    SipMethod getMethod() const { return method_; }
    const std::string& getRequestUri() const { return request_uri_; }

    SipResponseCode getResponseCode() const { return response_code_; }
    const std::string& getReasonPhrase() const { return reason_phrase_; }

    SipHeaders& getHeaders() { return headers_; }
    const SipHeaders& getHeaders() const { return headers_; }

    void setBody(const std::string& body);
    const std::string& getBody() const { return body_; }

    std::string getCallId() const { return headers_.getCallId(); }

    std::string toString() const;
    static core::Result<SipMessage> fromString(const std::string& message);

private:
    bool is_request_ = true;

    SipMethod method_ = SipMethod::INVITE;
    std::string request_uri_;

    SipResponseCode response_code_ = SipResponseCode::OK;
    std::string reason_phrase_;

    SipHeaders headers_;
    std::string body_;
};

std::string methodToString(SipMethod method);
SipMethod stringToMethod(const std::string& method);
std::string responseCodeToString(SipResponseCode code);

// Value of the ";tag=" parameter of a From/To header, empty if absent
std::string extractTag(const std::string& header);

// Address part of a From/To header without display name and parameters
std::string extractAddress(const std::string& header);

} // namespace rcs::sip
