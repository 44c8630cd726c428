#pragma once

#include "classification/classification.hpp"
#include "policy/text_policy.hpp"

#include <concepts>

namespace redactor {

/*
 * RedactionPolicy<C> binds a classification type to exactly one text policy.
 *
 * - The primary template is intentionally undefined
 * - Every classification used with classify<C> MUST provide a specialization
 * - policy() is a static table lookup, independent of runtime context
 *
 * Callers that need a different policy define a new classification type;
 * there is no per-call override.
 */
template<typename C>
struct RedactionPolicy;

template<typename C>
concept HasRedactionPolicy =
    Classification<C> &&
    requires {
        { RedactionPolicy<C>::policy() } -> std::convertible_to<TextRedactionPolicy>;
    };

template<HasRedactionPolicy C>
[[nodiscard]] inline TextRedactionPolicy policy_for() {
    return RedactionPolicy<C>::policy();
}

// ============================================================================
// Built-in bindings
// ============================================================================

template<> struct RedactionPolicy<Secret> {
    static TextRedactionPolicy policy() { return TextRedactionPolicy::default_full(); }
};

template<> struct RedactionPolicy<DateOfBirth> {
    static TextRedactionPolicy policy() { return TextRedactionPolicy::default_full(); }
};

template<> struct RedactionPolicy<AccountId> {
    static TextRedactionPolicy policy() { return TextRedactionPolicy::keep_last(4); }
};

template<> struct RedactionPolicy<SessionId> {
    static TextRedactionPolicy policy() { return TextRedactionPolicy::keep_last(4); }
};

template<> struct RedactionPolicy<NationalId> {
    static TextRedactionPolicy policy() { return TextRedactionPolicy::keep_last(4); }
};

template<> struct RedactionPolicy<CreditCard> {
    static TextRedactionPolicy policy() { return TextRedactionPolicy::keep_last(4); }
};

template<> struct RedactionPolicy<IpAddress> {
    static TextRedactionPolicy policy() { return TextRedactionPolicy::keep_last(4); }
};

template<> struct RedactionPolicy<BlockchainAddress> {
    static TextRedactionPolicy policy() { return TextRedactionPolicy::keep_last(6); }
};

template<> struct RedactionPolicy<Token> {
    static TextRedactionPolicy policy() { return TextRedactionPolicy::keep_last(4); }
};

template<> struct RedactionPolicy<PhoneNumber> {
    static TextRedactionPolicy policy() { return TextRedactionPolicy::keep_last(2); }
};

template<> struct RedactionPolicy<Email> {
    static TextRedactionPolicy policy() { return TextRedactionPolicy::keep_first(2); }
};

template<> struct RedactionPolicy<Pii> {
    static TextRedactionPolicy policy() { return TextRedactionPolicy::keep_last(4); }
};

} // namespace redactor

/**
 * @brief Bind a policy to a classification marker
 *
 * Must be used at global namespace scope:
 *
 *   REDACTOR_BIND_POLICY(app::OrderRef, redactor::TextRedactionPolicy::keep_last(3))
 */
#define REDACTOR_BIND_POLICY(Type, policy_expr)                                \
    template<> struct redactor::RedactionPolicy<Type> {                        \
        static ::redactor::TextRedactionPolicy policy() { return (policy_expr); } \
    };

/**
 * @brief Declare a classification marker struct in the current namespace
 *
 *   namespace app { REDACTOR_CLASSIFICATION(OrderRef, "order_ref") }
 *   REDACTOR_BIND_POLICY(app::OrderRef, redactor::TextRedactionPolicy::keep_last(3))
 */
#define REDACTOR_CLASSIFICATION(Type, type_name)                               \
    struct Type {                                                              \
        using classification_tag = void;                                       \
        static constexpr std::string_view name = type_name;                    \
    };
