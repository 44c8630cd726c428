#include "config/config_loader.hpp"
#include "core/utf8.hpp"
#include "core/utils.hpp"

#include <cstdlib>
#include <filesystem>
#include <format>
#include <stdexcept>
#include <unordered_set>

using namespace std::string_literals;

namespace redactor {

// ============================================================================
// TOML Parsing Helpers (env expansion, includes, merging)
// ============================================================================

namespace {

constexpr int kMaxIncludeDepth = 10;

/**
 * @brief Expand ${VAR_NAME} patterns in a string with environment variables.
 *
 * Unset variables expand to the empty string.
 */
std::string expand_env_vars(const std::string& input) {
    if (input.find("${") == std::string::npos) return input;

    std::string result;
    result.reserve(input.size());
    size_t i = 0;
    while (i < input.size()) {
        if (i + 1 < input.size() && input[i] == '$' && input[i + 1] == '{') {
            const size_t close = input.find('}', i + 2);
            if (close == std::string::npos) {
                throw std::runtime_error(
                    std::format("Unclosed env var substitution at position {}", i));
            }
            const std::string var_name = input.substr(i + 2, close - i - 2);
            const char* env_val = std::getenv(var_name.c_str());
            if (env_val) result += env_val;
            i = close + 1;
        } else {
            result += input[i++];
        }
    }
    return result;
}

void expand_env_vars_in_node(toml::node& node);

void expand_env_vars_recursive(toml::table& tbl) {
    for (auto&& [key, val] : tbl) {
        expand_env_vars_in_node(val);
    }
}

void expand_env_vars_in_node(toml::node& node) {
    if (auto* s = node.as_string()) {
        auto expanded = expand_env_vars(s->get());
        if (expanded != s->get()) {
            *s = std::move(expanded);
        }
    } else if (auto* tbl = node.as_table()) {
        expand_env_vars_recursive(*tbl);
    } else if (auto* arr = node.as_array()) {
        for (auto& elem : *arr) {
            expand_env_vars_in_node(elem);
        }
    }
}

/**
 * @brief Deep-merge two toml::tables. Overlay wins for scalars, arrays concatenate.
 */
void merge_tables(toml::table& base, const toml::table& overlay) {
    for (auto&& [key, val] : overlay) {
        auto* base_node = base.get(key);
        if (val.is_table() && base_node && base_node->is_table()) {
            merge_tables(*base_node->as_table(), *val.as_table());
        } else if (val.is_array() && base_node && base_node->is_array()) {
            auto& base_arr = *base_node->as_array();
            for (const auto& elem : *val.as_array()) {
                base_arr.push_back(elem);
            }
        } else {
            base.insert_or_assign(key, val);
        }
    }
}

/**
 * @brief Resolve include directives in a parsed TOML table.
 */
void resolve_includes(toml::table& root, const std::string& base_dir,
                      std::unordered_set<std::string>& visited, const int depth) {
    if (depth > kMaxIncludeDepth) {
        throw std::runtime_error(
            std::format("Config include depth exceeds {}", kMaxIncludeDepth));
    }
    auto inc_node = root["include"];
    if (!inc_node) return;

    std::vector<std::string> paths;
    if (inc_node.is_string()) {
        paths.emplace_back(inc_node.as_string()->get());
    } else if (inc_node.is_array()) {
        for (const auto& item : *inc_node.as_array()) {
            if (item.is_string()) {
                paths.emplace_back(item.as_string()->get());
            }
        }
    }
    root.erase("include");

    for (const auto& rel_path : paths) {
        namespace fs = std::filesystem;
        const std::string abs_path = fs::canonical(fs::path(base_dir) / rel_path).string();

        if (!visited.insert(abs_path).second) {
            throw std::runtime_error(
                std::format("Circular config include detected: {}", abs_path));
        }

        auto included = toml::parse_file(abs_path);
        const std::string inc_dir = fs::path(abs_path).parent_path().string();
        resolve_includes(included, inc_dir, visited, depth + 1);

        // Included file is the base, the including file overlays it
        merge_tables(included, root);
        root = std::move(included);
    }
}

toml::table parse_toml_string(const std::string& content) {
    auto result = toml::parse(content);
    expand_env_vars_recursive(result);
    return result;
}

toml::table parse_toml_file(const std::string& file_path) {
    auto result = toml::parse_file(file_path);

    namespace fs = std::filesystem;
    const std::string base_dir = fs::path(file_path).parent_path().string();
    std::unordered_set<std::string> visited;
    visited.insert(fs::canonical(file_path).string());
    resolve_includes(result, base_dir, visited, 0);

    expand_env_vars_recursive(result);
    return result;
}

std::optional<std::string> toml_optional_string(const toml::table& tbl, const std::string_view key) {
    if (const auto* v = tbl[key].as_string()) {
        return std::string(v->get());
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// ConfigLoader Implementation
// ============================================================================

// ---- Section extractors ----------------------------------------------------

LoggingConfig ConfigLoader::extract_logging(const toml::table& root) {
    LoggingConfig cfg;
    const auto* logging = root["logging"].as_table();
    if (!logging) return cfg;

    cfg.level = (*logging)["level"].value_or("info"s);
    return cfg;
}

std::vector<PolicyConfig> ConfigLoader::extract_policies(const toml::table& root) {
    std::vector<PolicyConfig> result;
    const auto* arr = root["policies"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* p = elem.as_table();
        if (!p) {
            throw std::runtime_error("[[policies]] entries must be tables");
        }

        PolicyConfig policy;
        policy.name = utils::trim((*p)["name"].value_or(""s));
        policy.kind = utils::to_lower((*p)["kind"].value_or("full"s));
        policy.prefix = (*p)["prefix"].value_or(int64_t{0});
        policy.suffix = (*p)["suffix"].value_or(int64_t{0});
        policy.mask_char = (*p)["mask_char"].value_or("*"s);
        policy.placeholder = toml_optional_string(*p, "placeholder");

        result.emplace_back(std::move(policy));
    }

    return result;
}

std::vector<DocumentRule> ConfigLoader::extract_document_rules(const toml::table& root) {
    std::vector<DocumentRule> result;
    const auto* arr = root["document_rules"].as_array();
    if (!arr) return result;
    result.reserve(arr->size());

    for (const auto& elem : *arr) {
        const auto* r = elem.as_table();
        if (!r) {
            throw std::runtime_error("[[document_rules]] entries must be tables");
        }

        DocumentRule rule;
        rule.path = utils::trim((*r)["path"].value_or(""s));
        rule.classification = utils::to_lower(utils::trim((*r)["classification"].value_or(""s)));
        result.emplace_back(std::move(rule));
    }

    return result;
}

RedactorConfig ConfigLoader::extract_all_sections(const toml::table& root) {
    RedactorConfig config;
    config.logging = extract_logging(root);
    config.policies = extract_policies(root);
    config.document_rules = extract_document_rules(root);
    return config;
}

// ---- Policy construction ---------------------------------------------------

Result<TextRedactionPolicy> ConfigLoader::build_policy(const PolicyConfig& config) {
    const auto fail = [&config](std::string message) {
        return Result<TextRedactionPolicy>::error(
            ErrorCategory::CONFIG_ERROR,
            std::format("policy '{}': {}", config.name, message));
    };

    if (config.prefix < 0 || config.suffix < 0) {
        return fail(std::format("prefix/suffix must be >= 0, got {}/{}",
                                config.prefix, config.suffix));
    }
    if (config.placeholder.has_value() && config.kind != "full") {
        return fail("placeholder is only valid for kind = \"full\"");
    }

    char32_t mask_char = kDefaultMaskChar;
    if (config.kind == "keep" || config.kind == "mask") {
        if (utf8::scalar_count(config.mask_char) != 1 || !utf8::is_valid(config.mask_char)) {
            return fail(std::format("mask_char must be exactly one character, got \"{}\"",
                                    config.mask_char));
        }
        size_t pos = 0;
        mask_char = utf8::decode(config.mask_char, pos);
    }

    const auto prefix = static_cast<size_t>(config.prefix);
    const auto suffix = static_cast<size_t>(config.suffix);

    if (config.kind == "full") {
        if (config.placeholder.has_value()) {
            return Result<TextRedactionPolicy>::ok(
                TextRedactionPolicy::full_with(*config.placeholder));
        }
        return Result<TextRedactionPolicy>::ok(TextRedactionPolicy::default_full());
    }
    if (config.kind == "keep") {
        return Result<TextRedactionPolicy>::ok(TextRedactionPolicy::keep_with(
            KeepConfig::both(prefix, suffix).with_mask_char(mask_char)));
    }
    if (config.kind == "mask") {
        return Result<TextRedactionPolicy>::ok(TextRedactionPolicy::mask_with(
            MaskConfig::both(prefix, suffix).with_mask_char(mask_char)));
    }
    return fail(std::format("unknown kind \"{}\" (expected full, keep or mask)", config.kind));
}

// ---- Validation ------------------------------------------------------------

std::vector<std::string> ConfigLoader::validate_config(const RedactorConfig& config) {
    std::vector<std::string> errors;

    if (!utils::log::parse_level(config.logging.level).has_value()) {
        errors.push_back(std::format("logging.level must be debug, info, warn or error, got \"{}\"",
                                     config.logging.level));
    }

    std::unordered_set<std::string> seen_names;
    for (size_t i = 0; i < config.policies.size(); ++i) {
        const auto& policy = config.policies[i];
        if (policy.name.empty()) {
            errors.push_back(std::format("policies[{}].name must not be empty", i));
            continue;
        }
        if (!seen_names.insert(utils::to_lower(policy.name)).second) {
            errors.push_back(std::format("policies[{}].name '{}' is defined twice", i, policy.name));
        }
        const auto built = build_policy(policy);
        if (built.is_error()) {
            errors.push_back(std::format("policies[{}]: {}", i, built.error_message()));
        }
    }

    for (size_t i = 0; i < config.document_rules.size(); ++i) {
        const auto& rule = config.document_rules[i];
        if (rule.path.empty()) {
            errors.push_back(std::format("document_rules[{}].path must not be empty", i));
        }
        if (rule.classification.empty()) {
            errors.push_back(std::format("document_rules[{}].classification must not be empty", i));
        }
    }

    return errors;
}

ConfigLoader::LoadResult ConfigLoader::validate_and_return(RedactorConfig config) {
    const auto errors = validate_config(config);
    if (!errors.empty()) {
        std::string combined = "Config validation failed:";
        for (const auto& err : errors) { combined += "\n  - "; combined += err; }
        return LoadResult::error(std::move(combined));
    }
    return LoadResult::ok(std::move(config));
}

// ---- Public API ------------------------------------------------------------

ConfigLoader::LoadResult ConfigLoader::load_from_file(const std::string& config_path) {
    try {
        const auto tbl = parse_toml_file(config_path);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to load config: {}", e.what()));
    }
}

ConfigLoader::LoadResult ConfigLoader::load_from_string(const std::string& toml_content) {
    try {
        const auto tbl = parse_toml_string(toml_content);
        return validate_and_return(extract_all_sections(tbl));
    } catch (const std::exception& e) {
        return LoadResult::error(std::format("Failed to parse config: {}", e.what()));
    }
}

} // namespace redactor
