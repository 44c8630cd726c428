#pragma once

#include "redact/field_ops.hpp"
#include "redact/mapper.hpp"
#include "redact/sensitive_type.hpp"

#include <utility>

namespace redactor {

template<typename T>
concept Redactable = SensitiveTypeOf<T> || ScalarRedaction<T>;

/**
 * @brief Redact with a caller-supplied mapper
 *
 * Scalars at the top level get their redacted default; everything else is
 * walked structurally.
 */
template<Redactable T, RedactionMapper M>
[[nodiscard]] T redact_with(T value, const M& mapper) {
    return field::walk(std::move(value), mapper);
}

/**
 * @brief Produce a sanitized copy of @p value
 *
 * The only sanctioned way to obtain a value that is safe to log. Uses the
 * shared DefaultMapper: scalar defaults plus each classification's bound
 * policy.
 */
template<Redactable T>
[[nodiscard]] T redact(T value) {
    return redact_with(std::move(value), kDefaultMapper);
}

} // namespace redactor
