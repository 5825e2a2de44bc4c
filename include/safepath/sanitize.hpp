#pragma once

#include "safepath/export.hpp"
#include "safepath/path_component.hpp"
#include "safepath/sanitize_policy.hpp"

#include <functional>
#include <string>

namespace safepath {

// Maps arbitrary text to text that must pass the component validator.
using Sanitizer = std::function<std::string(const std::string&)>;

// ============================================================================
// Default Sanitizer
// ============================================================================

// Replace separators, control bytes and (optionally) reserved characters,
// truncate to policy.max_length, and rewrite "", "." and "..".
SAFEPATH_API std::string sanitize_text(const std::string& text, const SanitizePolicy& policy);

// Throws std::invalid_argument when validate_policy() rejects the policy.
SAFEPATH_API Sanitizer make_sanitizer(SanitizePolicy policy);

// ============================================================================
// Sanitize and Wrap
// ============================================================================

// Run the sanitizer and wrap its output. Output that is not a valid component
// throws SanitizerInvariantError; so does an empty sanitizer.
SAFEPATH_API PathComponent sanitize_component(const std::string& text, const Sanitizer& sanitizer);

SAFEPATH_API PathComponent sanitize_component(const std::string& text, const SanitizePolicy& policy);
SAFEPATH_API PathComponent sanitize_component(const std::string& text);

} // namespace safepath
