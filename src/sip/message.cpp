#include "rcs/sip/message.hpp"
#include "rcs/core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace rcs::sip {

namespace {

std::string toLower(const std::string& value) {
    std::string lower = value;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

std::string trim(const std::string& value) {
    size_t begin = value.find_first_not_of(" \t");
    if (begin == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r");
    return value.substr(begin, end - begin + 1);
}

} // namespace

// SipHeaders implementation
std::string SipHeaders::canonicalName(const std::string& name) {
    std::string lower = toLower(trim(name));

    // Compact forms (RFC 3261 Section 7.3.3)
    if (lower == "i" || lower == "call-id") return "Call-ID";
    if (lower == "f" || lower == "from") return "From";
    if (lower == "t" || lower == "to") return "To";
    if (lower == "m" || lower == "contact") return "Contact";
    if (lower == "l" || lower == "content-length") return "Content-Length";
    if (lower == "c" || lower == "content-type") return "Content-Type";
    if (lower == "v" || lower == "via") return "Via";
    if (lower == "cseq") return "CSeq";

    return trim(name);
}

void SipHeaders::set(const std::string& name, const std::string& value) {
    std::string canonical = canonicalName(name);
    std::string key = toLower(canonical);

    auto it = std::find_if(fields_.begin(), fields_.end(),
                           [&key](const auto& field) { return toLower(field.first) == key; });
    if (it != fields_.end()) {
        it->second = value;
        return;
    }
    fields_.emplace_back(canonical, value);
}

void SipHeaders::add(const std::string& name, const std::string& value) {
    fields_.emplace_back(canonicalName(name), value);
}

std::string SipHeaders::get(const std::string& name) const {
    std::string key = toLower(canonicalName(name));
    for (const auto& [field, value] : fields_) {
        if (toLower(field) == key) {
            return value;
        }
    }
    return "";
}

bool SipHeaders::has(const std::string& name) const {
    std::string key = toLower(canonicalName(name));
    return std::any_of(fields_.begin(), fields_.end(),
                       [&key](const auto& field) { return toLower(field.first) == key; });
}

void SipHeaders::remove(const std::string& name) {
    std::string key = toLower(canonicalName(name));
    fields_.erase(std::remove_if(fields_.begin(), fields_.end(),
                                 [&key](const auto& field) { return toLower(field.first) == key; }),
                  fields_.end());
}

uint32_t SipHeaders::getCSeqNumber() const {
    std::istringstream iss(getCSeq());
    uint32_t cseq = 0;
    iss >> cseq;
    return cseq;
}

// SipMessage implementation
SipMessage::SipMessage(SipMethod method, std::string request_uri)
    : is_request_(true), method_(method), request_uri_(std::move(request_uri)) {
}

SipMessage::SipMessage(SipResponseCode code, const std::string& reason_phrase)
    : is_request_(false), response_code_(code), reason_phrase_(reason_phrase) {
    if (reason_phrase_.empty()) {
        reason_phrase_ = responseCodeToString(code);
    }
}

void SipMessage::setBody(const std::string& body) {
    body_ = body;
    headers_.set("Content-Length", std::to_string(body_.size()));
}

std::string SipMessage::toString() const {
    std::ostringstream oss;

    if (is_request_) {
        oss << methodToString(method_) << " " << request_uri_ << " SIP/2.0\r\n";
    } else {
        oss << "SIP/2.0 " << static_cast<int>(response_code_) << " " << reason_phrase_ << "\r\n";
    }

    for (const auto& [name, value] : headers_.getAll()) {
        oss << name << ": " << value << "\r\n";
    }
    if (!headers_.has("Content-Length")) {
        oss << "Content-Length: " << body_.size() << "\r\n";
    }

    oss << "\r\n" << body_;
    return oss.str();
}

core::Result<SipMessage> SipMessage::fromString(const std::string& message) {
    std::istringstream iss(message);
    std::string line;

    if (!std::getline(iss, line) || trim(line).empty()) {
        return {core::ErrorCode::PayloadError, "Invalid SIP message: empty start line"};
    }
    line = trim(line);

    SipMessage msg;
    std::istringstream start_line(line);

    if (line.rfind("SIP/2.0", 0) == 0) {
        std::string version;
        int code = 0;
        start_line >> version >> code;
        if (code < 100 || code > 699) {
            return {core::ErrorCode::PayloadError, "Invalid SIP status line: " + line};
        }

        msg.is_request_ = false;
        msg.response_code_ = static_cast<SipResponseCode>(code);

        std::string reason;
        std::getline(start_line, reason);
        msg.reason_phrase_ = trim(reason);
    } else {
        std::string method, uri, version;
        start_line >> method >> uri >> version;
        if (uri.empty() || version != "SIP/2.0") {
            return {core::ErrorCode::PayloadError, "Invalid SIP request line: " + line};
        }

        msg.is_request_ = true;
        msg.method_ = stringToMethod(method);
        msg.request_uri_ = uri;
    }

    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            break;
        }

        size_t colon_pos = line.find(':');
        if (colon_pos == std::string::npos) {
            core::Logger::debug("Skipping malformed SIP header line: {}", line);
            continue;
        }
        msg.headers_.add(line.substr(0, colon_pos), trim(line.substr(colon_pos + 1)));
    }

    std::ostringstream body;
    body << iss.rdbuf();
    msg.body_ = body.str();

    return msg;
}

// Utility functions
std::string methodToString(SipMethod method) {
    switch (method) {
        case SipMethod::INVITE: return "INVITE";
        case SipMethod::ACK: return "ACK";
        case SipMethod::BYE: return "BYE";
        case SipMethod::CANCEL: return "CANCEL";
        case SipMethod::OPTIONS: return "OPTIONS";
        case SipMethod::MESSAGE: return "MESSAGE";
        case SipMethod::UPDATE: return "UPDATE";
        default: return "UNKNOWN";
    }
}

SipMethod stringToMethod(const std::string& method) {
    if (method == "INVITE") return SipMethod::INVITE;
    if (method == "ACK") return SipMethod::ACK;
    if (method == "BYE") return SipMethod::BYE;
    if (method == "CANCEL") return SipMethod::CANCEL;
    if (method == "OPTIONS") return SipMethod::OPTIONS;
    if (method == "MESSAGE") return SipMethod::MESSAGE;
    if (method == "UPDATE") return SipMethod::UPDATE;
    return SipMethod::UNKNOWN;
}

std::string responseCodeToString(SipResponseCode code) {
    switch (code) {
        case SipResponseCode::Trying: return "Trying";
        case SipResponseCode::Ringing: return "Ringing";
        case SipResponseCode::SessionProgress: return "Session Progress";
        case SipResponseCode::OK: return "OK";
        case SipResponseCode::Accepted: return "Accepted";
        case SipResponseCode::BadRequest: return "Bad Request";
        case SipResponseCode::Forbidden: return "Forbidden";
        case SipResponseCode::NotFound: return "Not Found";
        case SipResponseCode::RequestTimeout: return "Request Timeout";
        case SipResponseCode::CallTransactionDoesNotExist: return "Call/Transaction Does Not Exist";
        case SipResponseCode::BusyHere: return "Busy Here";
        case SipResponseCode::RequestTerminated: return "Request Terminated";
        case SipResponseCode::ServerInternalError: return "Server Internal Error";
        case SipResponseCode::ServiceUnavailable: return "Service Unavailable";
        case SipResponseCode::Decline: return "Decline";
        default: return "Unknown";
    }
}

std::string extractTag(const std::string& header) {
    size_t tag_pos = header.find(";tag=");
    if (tag_pos == std::string::npos) {
        return "";
    }
    size_t begin = tag_pos + 5;
    size_t end = header.find(';', begin);
    return trim(header.substr(begin, end == std::string::npos ? std::string::npos : end - begin));
}

std::string extractAddress(const std::string& header) {
    size_t open = header.find('<');
    if (open != std::string::npos) {
        size_t close = header.find('>', open);
        if (close != std::string::npos) {
            return header.substr(open + 1, close - open - 1);
        }
    }
    return trim(header.substr(0, header.find(';')));
}

} // namespace rcs::sip
