#pragma once

#include "safepath/errors.hpp"
#include "safepath/export.hpp"

#include <cstddef>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <vector>

namespace safepath {

// ============================================================================
// Join Results
// ============================================================================

struct JoinResult {
    bool ok = false;
    std::filesystem::path path;                   // assembled path when ok, empty otherwise
    ComponentError error = ComponentError::None;  // why the rejected part failed
    std::size_t failed_index = 0;                 // index of the first rejected part
};

// ============================================================================
// Safe Joins
// ============================================================================

// Join parts, validating each one as a single normal component.
// Parts are processed left to right; the first invalid part aborts the
// whole join and nothing is returned. No parts yields an empty path.
SAFEPATH_API std::optional<std::filesystem::path> join_safe(
    const std::vector<std::filesystem::path>& parts);
SAFEPATH_API std::optional<std::filesystem::path> join_safe(
    std::initializer_list<std::filesystem::path> parts);

// Like join_safe, but the first part is appended as-is (it may be absolute or
// contain several components). Every later part is still validated.
// Precondition: at least one part. Throws JoinPreconditionError otherwise.
SAFEPATH_API std::optional<std::filesystem::path> join_safe_allow_first(
    const std::vector<std::filesystem::path>& parts);
SAFEPATH_API std::optional<std::filesystem::path> join_safe_allow_first(
    std::initializer_list<std::filesystem::path> parts);

// Variants reporting which part was rejected and why.
SAFEPATH_API JoinResult join_safe_checked(const std::vector<std::filesystem::path>& parts);
SAFEPATH_API JoinResult join_safe_allow_first_checked(
    const std::vector<std::filesystem::path>& parts);

// ============================================================================
// Unsafe Join
// ============================================================================

// Append every part without validation. An absolute part replaces everything
// before it, so this must not be used with untrusted input.
SAFEPATH_API std::filesystem::path join_unsafe(const std::vector<std::filesystem::path>& parts);
SAFEPATH_API std::filesystem::path join_unsafe(std::initializer_list<std::filesystem::path> parts);

} // namespace safepath
