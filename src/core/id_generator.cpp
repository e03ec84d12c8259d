#include <rcs/core/id_generator.hpp>

#include <mutex>
#include <random>
#include <sstream>

namespace rcs::core {

namespace {
    std::mutex generator_mutex;

    std::mt19937& engine() {
        static std::mt19937 gen{std::random_device{}()};
        return gen;
    }
}

std::string IdGenerator::generate(std::size_t length) {
    std::uniform_int_distribution<> dis(0, 15);
    std::ostringstream oss;

    std::lock_guard<std::mutex> lock(generator_mutex);
    for (std::size_t i = 0; i < length; ++i) {
        oss << std::hex << dis(engine());
    }
    return oss.str();
}

std::string IdGenerator::generateTransferId() {
    return generate(32);
}

std::string IdGenerator::generateCallId(const std::string& host) {
    std::string id = generate(24);
    if (!host.empty()) {
        id += "@" + host;
    }
    return id;
}

std::string IdGenerator::generateTag() {
    return generate(8);
}

} // namespace rcs::core
