#pragma once

#include <string>
#include <cstddef>

namespace rcs::core {

// Random lowercase hex identifiers for transfer ids, Call-IDs and tags
class IdGenerator {
public:
    static std::string generate(std::size_t length = 16);
    static std::string generateTransferId();
    static std::string generateCallId(const std::string& host);
    static std::string generateTag();
};

} // namespace rcs::core
