#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "policy/text_policy.hpp"

#include <toml++/toml.hpp>

#include <string>
#include <vector>

namespace redactor {

/**
 * @brief TOML configuration loader
 *
 * Supports `include = "other.toml"` (or an array of paths) relative to the
 * including file, and ${VAR} environment expansion in every string value.
 */
class ConfigLoader {
public:
    struct LoadResult {
        bool success;
        std::string error_message;
        RedactorConfig config;

        static LoadResult ok(RedactorConfig cfg) {
            LoadResult result;
            result.success = true;
            result.config = std::move(cfg);
            return result;
        }

        static LoadResult error(std::string message) {
            LoadResult result;
            result.success = false;
            result.error_message = std::move(message);
            return result;
        }
    };

    /**
     * @brief Load config from a TOML file
     * @param config_path Path to redactor.toml
     * @return LoadResult with parsed config or error
     */
    [[nodiscard]] static LoadResult load_from_file(const std::string& config_path);

    /**
     * @brief Load config from TOML text (includes are not resolved)
     */
    [[nodiscard]] static LoadResult load_from_string(const std::string& toml_content);

    /**
     * @brief Convert a [[policies]] entry into a text policy
     * @return CONFIG_ERROR naming the offending field
     */
    [[nodiscard]] static Result<TextRedactionPolicy> build_policy(const PolicyConfig& config);

    /**
     * @brief Validate a loaded config
     * @return Human-readable errors, empty when valid
     */
    [[nodiscard]] static std::vector<std::string> validate_config(const RedactorConfig& config);

private:
    static LoggingConfig extract_logging(const toml::table& root);
    static std::vector<PolicyConfig> extract_policies(const toml::table& root);
    static std::vector<DocumentRule> extract_document_rules(const toml::table& root);
    static RedactorConfig extract_all_sections(const toml::table& root);
    static LoadResult validate_and_return(RedactorConfig config);
};

} // namespace redactor
