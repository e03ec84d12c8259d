#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>
#include <memory>
#include <optional>
#include <filesystem>
#include <type_traits>

#include <rcs/core/error.hpp>

namespace rcs::core {

class ConfigNode;
using ConfigNodePtr = std::shared_ptr<ConfigNode>;

// Tipe nilai yang didukung dalam konfigurasi
struct ConfigValue;
using ConfigArray = std::vector<ConfigValue>;

struct ConfigValue : std::variant<
    std::nullptr_t,
    bool,
    int64_t,
    double,
    std::string,
    ConfigArray,
    ConfigNodePtr> {
    using variant::variant;
};

class ConfigNode : public std::enable_shared_from_this<ConfigNode> {
public:
    using Map = std::unordered_map<std::string, ConfigValue>;

    ConfigNode() = default;
    explicit ConfigNode(Map values) : values_(std::move(values)) {}

    static ConfigNodePtr create() {
        return std::make_shared<ConfigNode>();
    }

    static ConfigNodePtr create(Map values) {
        return std::make_shared<ConfigNode>(std::move(values));
    }

    template<typename T>
    Result<T> get(const std::string& key) const {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return {ErrorCode::InvalidArgument, "Configuration key not found: " + key};
        }

        const auto& base = static_cast<const ConfigValue::variant&>(it->second);
        if (const T* value = std::get_if<T>(&base)) {
            return *value;
        }
        return {ErrorCode::InvalidData, "Invalid type for key: " + key};
    }

    // Nilai default jika key tidak ada; tipe yang salah tetap error
    template<typename T>
    Result<T> getOr(const std::string& key, T fallback) const {
        if (!has(key)) {
            return fallback;
        }
        return get<T>(key);
    }

    template<typename T>
    void set(const std::string& key, T&& value) {
        values_[key] = ConfigValue(std::forward<T>(value));
    }

    bool has(const std::string& key) const {
        return values_.find(key) != values_.end();
    }

    void remove(const std::string& key) {
        values_.erase(key);
    }

    Result<ConfigNodePtr> getObject(const std::string& key) const {
        return get<ConfigNodePtr>(key);
    }

    ConfigNodePtr getOrCreateObject(const std::string& key) {
        auto it = values_.find(key);
        if (it != values_.end()) {
            if (auto node = std::get_if<ConfigNodePtr>(&static_cast<ConfigValue::variant&>(it->second))) {
                return *node;
            }
        }

        auto node = create();
        values_[key] = ConfigValue(node);
        return node;
    }

    const Map& values() const { return values_; }
    Map& values() { return values_; }

private:
    Map values_;
};

class Config {
public:
    static Config& instance() {
        static Config instance;
        return instance;
    }

    Config(const Config&) = delete;
    Config& operator=(const Config&) = delete;
    Config(Config&&) = delete;
    Config& operator=(Config&&) = delete;

    Result<void> loadFromFile(const std::filesystem::path& path);
    Result<void> saveToFile(const std::filesystem::path& path) const;
    Result<void> loadFromString(std::string_view data);
    Result<std::string> saveToString() const;

    ConfigNodePtr root() { return root_; }
    ConfigNodePtr root() const { return root_; }

    // Akses section tingkat atas, mis. "ft" atau "log"
    ConfigNodePtr section(const std::string& name) const;

    template<typename T>
    Result<T> get(const std::string& key) const {
        return root_->get<T>(key);
    }

    template<typename T>
    void set(const std::string& key, T&& value) {
        root_->set(key, std::forward<T>(value));
    }

    bool has(const std::string& key) const {
        return root_->has(key);
    }

    void remove(const std::string& key) {
        root_->remove(key);
    }

    void clear() {
        root_ = ConfigNode::create();
    }

private:
    Config() : root_(ConfigNode::create()) {}
    ConfigNodePtr root_;
};

inline Config& config() {
    return Config::instance();
}

} // namespace rcs::core
