#pragma once

#include "redact/classifiable.hpp"
#include "redact/mapper.hpp"
#include "redact/scalar_redaction.hpp"
#include "redact/sensitive_type.hpp"

#include <string_view>
#include <type_traits>
#include <utility>

namespace redactor {

/**
 * @brief How a composite treats one of its fields during redaction
 *
 * The resolved per-field tag; field::apply<S> dispatches on it.
 */
enum class FieldStrategy {
    PASS_THROUGH,   // moved through unchanged
    WALK,           // scalar default, or structural walk of a nested type
    CLASSIFY        // classification policy applied at the leaf
};

[[nodiscard]] inline constexpr std::string_view field_strategy_to_string(FieldStrategy s) {
    switch (s) {
        case FieldStrategy::PASS_THROUGH: return "PASS_THROUGH";
        case FieldStrategy::WALK:         return "WALK";
        case FieldStrategy::CLASSIFY:     return "CLASSIFY";
        default:                          return "UNKNOWN";
    }
}

/**
 * Per-field building blocks for composite redact_with members:
 *
 *   template<redactor::RedactionMapper M>
 *   Account redact_with(const M& mapper) && {
 *       return Account{
 *           .id       = redactor::field::pass(std::move(id)),
 *           .attempts = redactor::field::walk(std::move(attempts), mapper),
 *           .password = redactor::field::classify<redactor::Secret>(std::move(password), mapper),
 *       };
 *   }
 */
namespace field {

template<typename T>
[[nodiscard]] T pass(T value) {
    return value;
}

template<typename T, RedactionMapper M>
    requires ScalarRedaction<T> || SensitiveTypeOf<T>
[[nodiscard]] T walk(T value, const M& mapper) {
    if constexpr (ScalarRedaction<T>) {
        return mapper.map_scalar(value);
    } else {
        return SensitiveType<T>::redact_with(std::move(value), mapper);
    }
}

template<HasRedactionPolicy C, ClassifiableType T, RedactionMapper M>
[[nodiscard]] T classify(T value, const M& mapper) {
    return Classifiable<T>::template apply<C>(std::move(value), mapper);
}

/**
 * @brief Apply the behavior named by a resolved field tag
 *
 *   .password = redactor::field::apply<FieldStrategy::CLASSIFY, redactor::Secret>(std::move(password), mapper)
 */
template<FieldStrategy S, typename C = void, typename T, RedactionMapper M>
[[nodiscard]] T apply(T value, const M& mapper) {
    if constexpr (S == FieldStrategy::PASS_THROUGH) {
        return pass(std::move(value));
    } else if constexpr (S == FieldStrategy::WALK) {
        return walk(std::move(value), mapper);
    } else {
        static_assert(HasRedactionPolicy<C>, "CLASSIFY needs a classification with a bound policy");
        return classify<C>(std::move(value), mapper);
    }
}

} // namespace field

} // namespace redactor
