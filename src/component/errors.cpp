#include "safepath/errors.hpp"

namespace safepath {

namespace {

std::string describe_violation(const std::string& input, const std::string& output,
                               ComponentError reason) {
    return "sanitizer produced an invalid path component (" +
           std::string(component_error_to_string(reason)) + "): input \"" + input +
           "\" -> output \"" + output + "\"";
}

} // namespace

SanitizerInvariantError::SanitizerInvariantError(const std::string& input,
                                                 const std::string& output,
                                                 ComponentError reason)
    : std::logic_error(describe_violation(input, output, reason)),
      input_(input),
      output_(output),
      reason_(reason) {}

} // namespace safepath
