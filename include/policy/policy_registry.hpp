#pragma once

#include "core/error.hpp"
#include "policy/redaction_policy.hpp"
#include "policy/text_policy.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace redactor {

/**
 * @brief Policy registry - classification name -> text policy at run time
 *
 * The compile-time binding (RedactionPolicy<C>) covers values whose shape is
 * known statically. Values whose shape is only known at run time (JSON
 * documents, config-driven rules) refer to classifications by name and look
 * the policy up here.
 *
 * Typical lifecycle: populated once at start-up (built-ins plus config),
 * then shared read-only. Lookups take a shared lock; registration takes an
 * exclusive lock. Names are case-insensitive.
 */
class PolicyRegistry {
public:
    PolicyRegistry() = default;

    // Copies and moves lock the source (and target); locking may throw
    PolicyRegistry(const PolicyRegistry& other);
    PolicyRegistry& operator=(const PolicyRegistry& other);
    PolicyRegistry(PolicyRegistry&& other);
    PolicyRegistry& operator=(PolicyRegistry&& other);

    /**
     * @brief Registry pre-populated with every built-in classification
     */
    [[nodiscard]] static PolicyRegistry with_builtins();

    /**
     * @brief Register a policy under @p name
     * @return ok(true) on success; POLICY_ERROR for an empty or duplicate name
     */
    Result<bool> register_policy(std::string_view name, TextRedactionPolicy policy);

    /**
     * @brief Register a compile-time classification under its own name
     */
    template<HasRedactionPolicy C>
    Result<bool> register_classification() {
        return register_policy(C::name, policy_for<C>());
    }

    [[nodiscard]] std::optional<TextRedactionPolicy> find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const;
    [[nodiscard]] size_t size() const;

    /**
     * @brief Registered names, sorted
     */
    [[nodiscard]] std::vector<std::string> names() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, TextRedactionPolicy> policies_;
};

} // namespace redactor
