#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace redactor {

// ============================================================================
// Logging Config
// ============================================================================

struct LoggingConfig {
    std::string level = "info";
};

// ============================================================================
// Custom Policy Config
// ============================================================================

/**
 * @brief One [[policies]] entry, as written in the file
 *
 * Kept close to the TOML so validation can report field-level errors;
 * ConfigLoader::build_policy() turns it into a TextRedactionPolicy.
 */
struct PolicyConfig {
    std::string name;
    std::string kind = "full";                  // full | keep | mask
    int64_t prefix = 0;
    int64_t suffix = 0;
    std::string mask_char = "*";                // exactly one scalar
    std::optional<std::string> placeholder;     // full only
};

// ============================================================================
// Document Rules
// ============================================================================

/**
 * @brief Selects part of a JSON document and the classification applied there
 *
 * path is dotted ("customer.email"); arrays along the path are transparent.
 */
struct DocumentRule {
    std::string path;
    std::string classification;
};

// ============================================================================
// Top-level Config
// ============================================================================

struct RedactorConfig {
    LoggingConfig logging;
    std::vector<PolicyConfig> policies;
    std::vector<DocumentRule> document_rules;
};

} // namespace redactor
