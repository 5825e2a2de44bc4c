#pragma once

#include "safepath/export.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace safepath {

// ============================================================================
// Sanitize Policy
// ============================================================================

inline constexpr const char* SANITIZE_POLICY_SCHEMA = "safepath.sanitize.policy.v1";

struct SanitizePolicy {
    // Substituted for every rejected byte, and for empty/"."/".." results.
    std::string replacement = "_";
    // Upper bound on the output size in bytes.
    std::size_t max_length = 255;
    // Also replace < > : " | ? *
    bool replace_reserved = true;
};

SAFEPATH_API SanitizePolicy get_default_sanitize_policy();

// Returns an error message when the policy cannot guarantee valid output.
SAFEPATH_API std::optional<std::string> validate_policy(const SanitizePolicy& policy);

// ============================================================================
// Sanitize Policy Parsing
// ============================================================================

struct SanitizePolicyParseResult {
    bool ok = false;
    std::string error;
    SanitizePolicy policy;
    std::vector<std::string> warnings;
};

// Parse a policy document:
//   {"schema": "safepath.sanitize.policy.v1", "replacement": "_",
//    "max_length": 255, "replace_reserved": true}
// Missing fields keep their defaults.
SAFEPATH_API SanitizePolicyParseResult parse_sanitize_policy(const std::string& json_str,
                                                             const std::string& source_path = "");

} // namespace safepath
