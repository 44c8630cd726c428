#pragma once

#include <concepts>
#include <type_traits>

namespace redactor {

/// Value a redacted character field takes. A default character ('\0')
/// would not read as "redacted" in diagnostics.
inline constexpr char kRedactedChar = 'X';

template<typename T>
inline constexpr bool is_character_v =
    std::is_same_v<T, char> ||
    std::is_same_v<T, wchar_t> ||
    std::is_same_v<T, char8_t> ||
    std::is_same_v<T, char16_t> ||
    std::is_same_v<T, char32_t>;

/**
 * @brief The closed set of primitive kinds with a redacted default
 *
 * bool, the integral types (signed/unsigned char count as the 8-bit integer
 * types), the floating types, and the character types. Cv-qualified or
 * reference types are not scalars here; traversal strips them first.
 */
template<typename T>
concept ScalarRedaction =
    std::is_same_v<T, std::remove_cvref_t<T>> && std::is_arithmetic_v<T>;

/**
 * @brief Redact a scalar to its default
 *
 * bool -> false, numbers -> 0, characters -> 'X'.
 */
template<ScalarRedaction T>
[[nodiscard]] constexpr T redact_scalar(T /*value*/) noexcept {
    if constexpr (std::is_same_v<T, bool>) {
        return false;
    } else if constexpr (is_character_v<T>) {
        return static_cast<T>(kRedactedChar);
    } else {
        return T{};
    }
}

} // namespace redactor
