#include <rcs/content/contact_id.hpp>

#include <algorithm>
#include <cctype>

namespace rcs::content {

core::Result<ContactId> ContactId::create(const std::string& value) {
    std::string trimmed = value;
    trimmed.erase(0, trimmed.find_first_not_of(" \t"));
    trimmed.erase(trimmed.find_last_not_of(" \t") + 1);

    if (trimmed.empty()) {
        return {core::ErrorCode::InvalidArgument, "Contact identifier is empty"};
    }

    // Strip a tel: prefix and visual separators from phone numbers
    if (trimmed.rfind("tel:", 0) == 0) {
        trimmed = trimmed.substr(4);
    }

    if (trimmed.find('@') == std::string::npos) {
        trimmed.erase(std::remove_if(trimmed.begin(), trimmed.end(),
                                     [](unsigned char c) { return c == '-' || c == ' ' || c == '.'; }),
                      trimmed.end());

        bool valid = !trimmed.empty() &&
            std::all_of(trimmed.begin(), trimmed.end(), [](unsigned char c) {
                return std::isdigit(c) || c == '+';
            });
        if (!valid || trimmed.find('+', 1) != std::string::npos) {
            return {core::ErrorCode::InvalidArgument, "Unsupported contact format: " + value};
        }
    }

    return ContactId(std::move(trimmed));
}

} // namespace rcs::content
