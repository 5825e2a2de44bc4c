#include "safepath/join.hpp"
#include "safepath/path_builder.hpp"

#include <utility>

namespace safepath {

namespace {

// Validate and append parts[start..]; the builder is discarded on failure.
JoinResult finish_join(PathBuilder builder, const std::vector<std::filesystem::path>& parts,
                       std::size_t start) {
    JoinResult result;
    for (std::size_t i = start; i < parts.size(); ++i) {
        ComponentError error = builder.push_checked(parts[i]);
        if (error != ComponentError::None) {
            result.error = error;
            result.failed_index = i;
            return result;
        }
    }
    result.ok = true;
    result.path = std::move(builder).take();
    return result;
}

std::optional<std::filesystem::path> to_optional(JoinResult result) {
    if (!result.ok) {
        return std::nullopt;
    }
    return std::move(result.path);
}

} // namespace

// ============================================================================
// Safe Joins
// ============================================================================

JoinResult join_safe_checked(const std::vector<std::filesystem::path>& parts) {
    return finish_join(PathBuilder{}, parts, 0);
}

JoinResult join_safe_allow_first_checked(const std::vector<std::filesystem::path>& parts) {
    if (parts.empty()) {
        throw JoinPreconditionError(
            "join_safe_allow_first requires at least one part (the trusted root)");
    }
    return finish_join(PathBuilder{parts.front()}, parts, 1);
}

std::optional<std::filesystem::path> join_safe(const std::vector<std::filesystem::path>& parts) {
    return to_optional(join_safe_checked(parts));
}

std::optional<std::filesystem::path> join_safe(std::initializer_list<std::filesystem::path> parts) {
    return join_safe(std::vector<std::filesystem::path>(parts));
}

std::optional<std::filesystem::path> join_safe_allow_first(
    const std::vector<std::filesystem::path>& parts) {
    return to_optional(join_safe_allow_first_checked(parts));
}

std::optional<std::filesystem::path> join_safe_allow_first(
    std::initializer_list<std::filesystem::path> parts) {
    return join_safe_allow_first(std::vector<std::filesystem::path>(parts));
}

// ============================================================================
// Unsafe Join
// ============================================================================

std::filesystem::path join_unsafe(const std::vector<std::filesystem::path>& parts) {
    PathBuilder builder;
    for (const auto& part : parts) {
        builder.push_unchecked(part);
    }
    return std::move(builder).take();
}

std::filesystem::path join_unsafe(std::initializer_list<std::filesystem::path> parts) {
    return join_unsafe(std::vector<std::filesystem::path>(parts));
}

} // namespace safepath
