#include "safepath/sanitize.hpp"
#include "safepath/errors.hpp"

#include <spdlog/spdlog.h>

#include <cstring>
#include <optional>
#include <stdexcept>
#include <utility>

namespace safepath {

namespace {

bool is_control(unsigned char c) {
    return c < 0x20 || c == 0x7F;
}

bool is_reserved(unsigned char c) {
    return c != '\0' && std::strchr("<>:\"|?*", c) != nullptr;
}

bool is_rejected(unsigned char c, const SanitizePolicy& policy) {
    if (c == '/' || c == '\\' || is_control(c)) {
        return true;
    }
#ifdef _WIN32
    // "C:" would parse as a drive prefix.
    if (c == ':') {
        return true;
    }
#endif
    return policy.replace_reserved && is_reserved(c);
}

// Cut to at most max_length bytes without splitting a UTF-8 sequence.
void truncate_utf8(std::string& s, std::size_t max_length) {
    if (s.size() <= max_length) {
        return;
    }
    std::size_t n = max_length;
    while (n > 0 && (static_cast<unsigned char>(s[n]) & 0xC0) == 0x80) {
        --n;
    }
    s.resize(n);
}

} // namespace

std::optional<std::string> validate_policy(const SanitizePolicy& policy) {
    if (policy.max_length == 0) {
        return std::string("max_length must be at least 1");
    }
    if (policy.replacement.empty()) {
        return std::string("replacement must not be empty");
    }
    if (policy.replacement.size() > policy.max_length) {
        return std::string("replacement is longer than max_length");
    }
    auto first = static_cast<unsigned char>(policy.replacement.front());
    if (first == '.') {
        return std::string("replacement must not start with '.'");
    }
    if ((first & 0xC0) == 0x80) {
        return std::string("replacement must not start with a UTF-8 continuation byte");
    }
    for (char ch : policy.replacement) {
        if (is_rejected(static_cast<unsigned char>(ch), policy)) {
            return std::string("replacement contains a character the sanitizer replaces");
        }
    }
    return std::nullopt;
}

// ============================================================================
// Default Sanitizer
// ============================================================================

std::string sanitize_text(const std::string& text, const SanitizePolicy& policy) {
    std::string out;
    out.reserve(text.size());
    for (char ch : text) {
        if (is_rejected(static_cast<unsigned char>(ch), policy)) {
            out += policy.replacement;
        } else {
            out += ch;
        }
    }
    truncate_utf8(out, policy.max_length);

    if (out.empty()) {
        out = policy.replacement;
    } else if (out == "." || out == "..") {
        std::string dots;
        dots.swap(out);
        for (std::size_t i = 0; i < dots.size(); ++i) {
            out += policy.replacement;
        }
    }
    truncate_utf8(out, policy.max_length);
    return out;
}

Sanitizer make_sanitizer(SanitizePolicy policy) {
    if (auto problem = validate_policy(policy)) {
        throw std::invalid_argument("invalid sanitize policy: " + *problem);
    }
    return [policy = std::move(policy)](const std::string& text) {
        return sanitize_text(text, policy);
    };
}

// ============================================================================
// Sanitize and Wrap
// ============================================================================

PathComponent sanitize_component(const std::string& text, const Sanitizer& sanitizer) {
    if (!sanitizer) {
        throw std::logic_error("sanitize_component called without a sanitizer");
    }

    std::string output = sanitizer(text);
    auto component = PathComponent::create(output);
    if (!component) {
        SanitizerInvariantError error(text, output, classify_component(output));
        spdlog::error("{}", error.what());
        throw error;
    }
    return *component;
}

PathComponent sanitize_component(const std::string& text, const SanitizePolicy& policy) {
    return sanitize_component(text, make_sanitizer(policy));
}

PathComponent sanitize_component(const std::string& text) {
    return sanitize_component(text, get_default_sanitize_policy());
}

} // namespace safepath
