#pragma once

#include "config/config_types.hpp"
#include "core/error.hpp"
#include "policy/policy_registry.hpp"
#include "policy/text_policy.hpp"

#include <glaze/glaze.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace redactor {

/**
 * @brief Redacts JSON documents whose shape is only known at run time
 *
 * Rules are compiled once into a path trie. Redaction then walks the
 * document and the trie together:
 *   - object members are followed by name; arrays are transparent
 *   - a node selected by a rule is redacted as a whole: strings through the
 *     rule's policy, numbers to 0, booleans to false, null kept, arrays and
 *     objects member-wise (object keys are never touched)
 *   - everything else is left as is
 *
 * Immutable after create(), safe to share across threads.
 */
class DocumentRedactor {
public:
    /**
     * @brief Compile rules against a registry
     * @return CONFIG_ERROR for malformed paths, unknown classifications or
     *         conflicting rules on the same path
     */
    [[nodiscard]] static Result<DocumentRedactor> create(const std::vector<DocumentRule>& rules,
                                                         const PolicyRegistry& registry);

    /**
     * @brief Redact a parsed document (total)
     */
    [[nodiscard]] glz::json_t redact(glz::json_t document) const;

    /**
     * @brief Parse, redact and re-serialize JSON text
     * @return DOCUMENT_ERROR when the input is not valid JSON
     */
    [[nodiscard]] Result<std::string> redact_text(std::string_view json_text) const;

    [[nodiscard]] size_t rule_count() const { return rule_count_; }

private:
    struct PathNode {
        std::optional<TextRedactionPolicy> policy;
        std::string classification;
        std::map<std::string, PathNode, std::less<>> children;
    };

    DocumentRedactor() = default;

    void redact_along(glz::json_t& node, const PathNode& path) const;
    static void redact_selected(glz::json_t& node, const TextRedactionPolicy& policy);

    PathNode root_;
    size_t rule_count_ = 0;
};

/**
 * @brief Split a dotted rule path ("a.b.c") into its segments
 * @return empty when any segment is empty
 */
[[nodiscard]] std::vector<std::string> split_rule_path(std::string_view path);

} // namespace redactor
