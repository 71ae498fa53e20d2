#pragma once

#include <cstddef>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace reachability {

/**
 * @brief Process-wide set of checkers that declared expectations but never ran
 *
 * A checker adds itself when it records an expectation and removes itself the
 * first time a check executes, whether or not that check passes. A test
 * harness inspects the set after each test to catch expectations that were
 * declared and then never verified. Entries are identities only; the registry
 * never dereferences them.
 */
class unactivated_registry {
public:
    unactivated_registry() = default;
    unactivated_registry(const unactivated_registry&) = delete;
    unactivated_registry& operator=(const unactivated_registry&) = delete;

    auto add(const void* checker) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _checkers.insert(checker);
    }

    auto discard(const void* checker) -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _checkers.erase(checker);
    }

    [[nodiscard]] auto contains(const void* checker) const -> bool {
        std::lock_guard<std::mutex> lock(_mutex);
        return _checkers.contains(checker);
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard<std::mutex> lock(_mutex);
        return _checkers.size();
    }

    [[nodiscard]] auto snapshot() const -> std::vector<const void*> {
        std::lock_guard<std::mutex> lock(_mutex);
        return {_checkers.begin(), _checkers.end()};
    }

    auto clear() -> void {
        std::lock_guard<std::mutex> lock(_mutex);
        _checkers.clear();
    }

private:
    mutable std::mutex _mutex;
    std::unordered_set<const void*> _checkers;
};

inline auto unactivated_checkers() -> unactivated_registry& {
    static unactivated_registry registry;
    return registry;
}

} // namespace reachability
