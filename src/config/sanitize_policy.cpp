#include "safepath/sanitize_policy.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace safepath {

namespace {

const char* const KNOWN_KEYS[] = {"schema", "replacement", "max_length", "replace_reserved"};

bool is_known_key(const std::string& key) {
    for (const char* known : KNOWN_KEYS) {
        if (key == known) {
            return true;
        }
    }
    return false;
}

} // namespace

SanitizePolicy get_default_sanitize_policy() {
    return SanitizePolicy{};
}

SanitizePolicyParseResult parse_sanitize_policy(const std::string& json_str,
                                                const std::string& source_path) {
    SanitizePolicyParseResult result;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "sanitize policy must be a JSON object";
            return result;
        }

        if (!j.contains("schema") || !j["schema"].is_string()) {
            result.error = "missing schema";
            return result;
        }
        std::string schema = j["schema"].get<std::string>();
        if (schema != SANITIZE_POLICY_SCHEMA) {
            result.error = "unsupported schema: " + schema;
            return result;
        }

        if (j.contains("replacement")) {
            if (!j["replacement"].is_string()) {
                result.error = "replacement must be a string";
                return result;
            }
            result.policy.replacement = j["replacement"].get<std::string>();
        }

        if (j.contains("max_length")) {
            if (!j["max_length"].is_number_unsigned()) {
                result.error = "max_length must be a non-negative integer";
                return result;
            }
            result.policy.max_length = j["max_length"].get<std::size_t>();
        }

        if (j.contains("replace_reserved")) {
            if (!j["replace_reserved"].is_boolean()) {
                result.error = "replace_reserved must be a boolean";
                return result;
            }
            result.policy.replace_reserved = j["replace_reserved"].get<bool>();
        }

        for (auto it = j.begin(); it != j.end(); ++it) {
            if (!is_known_key(it.key())) {
                result.warnings.push_back("unknown_key:" + it.key());
            }
        }

        if (auto problem = validate_policy(result.policy)) {
            result.error = "invalid policy: " + *problem;
            return result;
        }

        for (const auto& w : result.warnings) {
            spdlog::warn("sanitize policy {}: {}", source_path.empty() ? "<inline>" : source_path, w);
        }
        spdlog::debug("Loaded sanitize policy from {} (replacement \"{}\", max_length {})",
                      source_path.empty() ? "<inline>" : source_path,
                      result.policy.replacement, result.policy.max_length);

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

} // namespace safepath
