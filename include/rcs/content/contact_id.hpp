#pragma once

#include <string>
#include <ostream>
#include <functional>

#include <rcs/core/error.hpp>

namespace rcs::content {

// Remote party identity. Resolution (MSISDN, tel/sip URI) happens upstream;
// this type only carries the normalized form.
class ContactId {
public:
    ContactId() = default;

    static core::Result<ContactId> create(const std::string& value);

    const std::string& toString() const { return value_; }
    bool empty() const { return value_.empty(); }

    bool operator==(const ContactId& other) const { return value_ == other.value_; }
    bool operator!=(const ContactId& other) const { return value_ != other.value_; }

private:
    explicit ContactId(std::string value) : value_(std::move(value)) {}

    std::string value_;
};

inline std::ostream& operator<<(std::ostream& os, const ContactId& contact) {
    return os << contact.toString();
}

} // namespace rcs::content

namespace std {
    template<>
    struct hash<rcs::content::ContactId> {
        size_t operator()(const rcs::content::ContactId& contact) const noexcept {
            return hash<string>()(contact.toString());
        }
    };
}
