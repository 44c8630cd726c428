#pragma once

#include <concepts>
#include <string_view>
#include <type_traits>

namespace redactor {

/**
 * @brief Classification markers - "what kind of sensitive data is this?"
 *
 * A classification is an empty, trivially copyable struct that exists only
 * at the type level. It carries no runtime state; the policy bound to it is
 * looked up by type through RedactionPolicy<C> (policy/redaction_policy.hpp).
 *
 * Defining a new classification:
 *
 *   struct OrderReference {
 *       using classification_tag = void;
 *       static constexpr std::string_view name = "order_reference";
 *   };
 *
 * or use REDACTOR_CLASSIFICATION, then bind a policy with REDACTOR_BIND_POLICY.
 */
template<typename C>
concept Classification =
    std::is_empty_v<C> &&
    std::is_trivially_copyable_v<C> &&
    requires {
        typename C::classification_tag;
        { C::name } -> std::convertible_to<std::string_view>;
    };

template<Classification C>
[[nodiscard]] constexpr std::string_view classification_name() noexcept {
    return C::name;
}

// ============================================================================
// Built-in classifications
// ============================================================================

/// Account identifiers.
struct AccountId {
    using classification_tag = void;
    static constexpr std::string_view name = "account_id";
};

/// Blockchain addresses (Ethereum, Bitcoin, ...).
struct BlockchainAddress {
    using classification_tag = void;
    static constexpr std::string_view name = "blockchain_address";
};

/// Credit card numbers or PANs.
struct CreditCard {
    using classification_tag = void;
    static constexpr std::string_view name = "credit_card";
};

struct DateOfBirth {
    using classification_tag = void;
    static constexpr std::string_view name = "date_of_birth";
};

struct Email {
    using classification_tag = void;
    static constexpr std::string_view name = "email";
};

struct IpAddress {
    using classification_tag = void;
    static constexpr std::string_view name = "ip_address";
};

/// Government-issued identifiers.
struct NationalId {
    using classification_tag = void;
    static constexpr std::string_view name = "national_id";
};

struct PhoneNumber {
    using classification_tag = void;
    static constexpr std::string_view name = "phone_number";
};

/// Generic personally identifiable information.
struct Pii {
    using classification_tag = void;
    static constexpr std::string_view name = "pii";
};

/// Passwords, private keys and other secrets.
struct Secret {
    using classification_tag = void;
    static constexpr std::string_view name = "secret";
};

struct SessionId {
    using classification_tag = void;
    static constexpr std::string_view name = "session_id";
};

/// Authentication tokens and API keys.
struct Token {
    using classification_tag = void;
    static constexpr std::string_view name = "token";
};

} // namespace redactor
