#pragma once

#include <algorithm>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <rcs/core/logger.hpp>

namespace rcs::ims {

// Registered observers. Iteration works on a snapshot taken under the lock,
// so a listener may add or remove listeners from inside its callback.
template<typename L>
class ListenerSet {
public:
    using ListenerPtr = std::shared_ptr<L>;

    bool add(ListenerPtr listener) {
        if (!listener) {
            return false;
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (std::find(listeners_.begin(), listeners_.end(), listener) != listeners_.end()) {
            return false;
        }
        listeners_.push_back(std::move(listener));
        return true;
    }

    bool remove(const ListenerPtr& listener) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = std::find(listeners_.begin(), listeners_.end(), listener);
        if (it == listeners_.end()) {
            return false;
        }
        listeners_.erase(it);
        return true;
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        listeners_.clear();
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_.size();
    }

    std::vector<ListenerPtr> snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return listeners_;
    }

    // Invokes fn once per listener in registration order. A listener that
    // throws is logged and skipped; the remaining listeners still run.
    template<typename F>
    void forEach(const std::string& event, F&& fn) const {
        for (const auto& listener : snapshot()) {
            try {
                fn(*listener);
            }
            catch (const std::exception& e) {
                core::Logger::error("Listener failed on {}: {}", event, e.what());
            }
        }
    }

private:
    std::vector<ListenerPtr> listeners_;
    mutable std::mutex mutex_;
};

} // namespace rcs::ims
