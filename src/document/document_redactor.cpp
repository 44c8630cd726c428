#include "document/document_redactor.hpp"
#include "core/utils.hpp"

#include <format>

namespace redactor {

std::vector<std::string> split_rule_path(std::string_view path) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        const size_t dot = path.find('.', start);
        const std::string segment = utils::trim(path.substr(start, dot - start));
        if (segment.empty()) {
            return {};
        }
        segments.push_back(segment);
        if (dot == std::string_view::npos) {
            break;
        }
        start = dot + 1;
    }
    return segments;
}

// ============================================================================
// Rule compilation
// ============================================================================

Result<DocumentRedactor> DocumentRedactor::create(const std::vector<DocumentRule>& rules,
                                                  const PolicyRegistry& registry) {
    DocumentRedactor redactor;

    for (const auto& rule : rules) {
        const auto segments = split_rule_path(rule.path);
        if (segments.empty()) {
            return Result<DocumentRedactor>::error(
                ErrorCategory::CONFIG_ERROR,
                std::format("Invalid document rule path '{}'", rule.path));
        }

        const std::string classification = utils::to_lower(utils::trim(rule.classification));
        auto policy = registry.find(classification);
        if (!policy.has_value()) {
            return Result<DocumentRedactor>::error(
                ErrorCategory::CONFIG_ERROR,
                std::format("Document rule '{}' names unknown classification '{}'",
                            rule.path, rule.classification));
        }

        PathNode* node = &redactor.root_;
        for (const auto& segment : segments) {
            node = &node->children[segment];
        }

        if (node->policy.has_value()) {
            if (node->classification != classification) {
                return Result<DocumentRedactor>::error(
                    ErrorCategory::CONFIG_ERROR,
                    std::format("Document rule '{}' classified as both '{}' and '{}'",
                                rule.path, node->classification, classification));
            }
            continue;
        }

        node->policy = std::move(*policy);
        node->classification = classification;
        ++redactor.rule_count_;
        utils::log::debug(std::format("Document rule: {} -> {}", rule.path, classification));
    }

    return Result<DocumentRedactor>::ok(std::move(redactor));
}

// ============================================================================
// Redaction
// ============================================================================

glz::json_t DocumentRedactor::redact(glz::json_t document) const {
    redact_along(document, root_);
    return document;
}

void DocumentRedactor::redact_along(glz::json_t& node, const PathNode& path) const {
    if (path.policy.has_value()) {
        redact_selected(node, *path.policy);
        return;
    }

    if (node.is_array()) {
        for (auto& element : node.get_array()) {
            redact_along(element, path);
        }
    } else if (node.is_object()) {
        auto& members = node.get_object();
        for (const auto& [name, child] : path.children) {
            const auto it = members.find(name);
            if (it != members.end()) {
                redact_along(it->second, child);
            }
        }
    }
}

void DocumentRedactor::redact_selected(glz::json_t& node, const TextRedactionPolicy& policy) {
    if (node.is_string()) {
        node = policy.apply_to(node.get<std::string>());
    } else if (node.is_number()) {
        node = 0.0;
    } else if (node.is_boolean()) {
        node = false;
    } else if (node.is_array()) {
        for (auto& element : node.get_array()) {
            redact_selected(element, policy);
        }
    } else if (node.is_object()) {
        for (auto& [key, value] : node.get_object()) {
            redact_selected(value, policy);
        }
    }
    // null stays null
}

Result<std::string> DocumentRedactor::redact_text(std::string_view json_text) const {
    const std::string buffer(json_text);
    glz::json_t document;
    const auto ec = glz::read_json(document, buffer);
    if (ec) {
        return Result<std::string>::error(
            ErrorCategory::DOCUMENT_ERROR,
            std::format("Failed to parse JSON document: {}", glz::format_error(ec, buffer)));
    }

    const auto redacted = redact(std::move(document));
    auto written = glz::write_json(redacted);
    if (!written) {
        return Result<std::string>::error(
            ErrorCategory::INTERNAL_ERROR,
            std::format("Failed to serialize redacted document (glaze error code {})",
                        static_cast<int>(written.error().ec)));
    }
    return Result<std::string>::ok(std::move(*written));
}

} // namespace redactor
