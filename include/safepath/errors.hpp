#pragma once

#include "safepath/export.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace safepath {

// ============================================================================
// Component Classification
// ============================================================================

// Reason a candidate is not a single normal path component.
enum class ComponentError {
    None,
    Empty,               // no components at all
    RootName,            // drive letter or UNC prefix (Windows)
    RootDirectory,       // leading separator
    MultipleComponents,  // any separator, trailing separators included
    CurrentDirectory,    // "."
    ParentDirectory,     // ".."
};

inline const char* component_error_to_string(ComponentError e) {
    switch (e) {
        case ComponentError::None: return "none";
        case ComponentError::Empty: return "empty";
        case ComponentError::RootName: return "root_name";
        case ComponentError::RootDirectory: return "root_directory";
        case ComponentError::MultipleComponents: return "multiple_components";
        case ComponentError::CurrentDirectory: return "current_directory";
        case ComponentError::ParentDirectory: return "parent_directory";
    }
    return "unknown";
}

// Classify a candidate using native path parsing.
// Returns ComponentError::None when it is exactly one normal component.
SAFEPATH_API ComponentError classify_component(const std::filesystem::path& candidate);

// ============================================================================
// Internal Faults
// ============================================================================

// A sanitizer produced text that is not a valid component. This is a bug in
// the sanitizer, never a user input error.
class SAFEPATH_API SanitizerInvariantError : public std::logic_error {
public:
    SanitizerInvariantError(const std::string& input, const std::string& output,
                            ComponentError reason);

    const std::string& input() const noexcept { return input_; }
    const std::string& output() const noexcept { return output_; }
    ComponentError reason() const noexcept { return reason_; }

private:
    std::string input_;
    std::string output_;
    ComponentError reason_;
};

// A join was invoked in a way its contract forbids
// (trusted-first mode without any part).
class SAFEPATH_API JoinPreconditionError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

} // namespace safepath
