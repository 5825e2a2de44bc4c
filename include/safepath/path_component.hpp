#pragma once

#include "safepath/errors.hpp"
#include "safepath/export.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <utility>

namespace safepath {

// ============================================================================
// PathComponent
// ============================================================================

/**
 * A single normal path component: a plain file or directory name.
 *
 * Decomposing the wrapped path yields exactly one element, and that element
 * is not a root, a drive/UNC prefix, "." or "..". The only way to obtain an
 * instance is create(), so the invariant holds for every live object.
 * Instances are immutable and safe to share between threads for reading.
 */
class SAFEPATH_API PathComponent {
public:
    // Returns std::nullopt when candidate is not a single normal component.
    static std::optional<PathComponent> create(std::filesystem::path candidate);

    const std::filesystem::path& path() const noexcept { return path_; }
    const std::filesystem::path::string_type& native() const noexcept { return path_.native(); }
    std::string string() const { return path_.string(); }

    operator const std::filesystem::path&() const noexcept { return path_; }

    friend bool operator==(const PathComponent& a, const PathComponent& b) {
        return a.path_ == b.path_;
    }
    friend bool operator!=(const PathComponent& a, const PathComponent& b) {
        return !(a == b);
    }
    friend bool operator<(const PathComponent& a, const PathComponent& b) {
        return a.path_ < b.path_;
    }

private:
    explicit PathComponent(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};

// Free-function form of PathComponent::create.
SAFEPATH_API std::optional<PathComponent> validate_component(const std::filesystem::path& candidate);

} // namespace safepath

namespace std {

template <>
struct hash<safepath::PathComponent> {
    size_t operator()(const safepath::PathComponent& c) const noexcept {
        return std::filesystem::hash_value(c.path());
    }
};

} // namespace std
