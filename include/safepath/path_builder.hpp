#pragma once

#include "safepath/errors.hpp"
#include "safepath/export.hpp"
#include "safepath/path_component.hpp"

#include <filesystem>
#include <utility>

namespace safepath {

// ============================================================================
// PathBuilder
// ============================================================================

// Accumulates a path one part at a time. A builder belongs to a single join
// operation and is consumed by take().
class SAFEPATH_API PathBuilder {
public:
    PathBuilder() = default;

    // Start from a trusted prefix. It may be absolute or hold several components.
    explicit PathBuilder(std::filesystem::path trusted_root) : path_(std::move(trusted_root)) {}

    // Append one validated component.
    void push(const PathComponent& component);

    // Append without validation. An absolute part replaces the accumulated path.
    void push_unchecked(const std::filesystem::path& part);

    // Validate then append. On failure the builder is left unchanged.
    ComponentError push_checked(const std::filesystem::path& part);

    bool empty() const noexcept { return path_.empty(); }
    const std::filesystem::path& view() const noexcept { return path_; }

    std::filesystem::path take() && { return std::move(path_); }

private:
    std::filesystem::path path_;
};

} // namespace safepath
