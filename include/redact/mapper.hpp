#pragma once

#include "classification/classification.hpp"
#include "policy/redaction_policy.hpp"
#include "redact/scalar_redaction.hpp"
#include "redact/sensitive_value.hpp"

#include <concepts>
#include <string>
#include <utility>

namespace redactor {

/**
 * @brief Redaction strategy threaded through a traversal
 *
 * A mapper is stateless and shared by const reference. It supplies the two
 * leaf operations a traversal needs:
 *   map_scalar(T) -> T             scalar default substitution
 *   map_sensitive<C>(T) -> T       classification-driven leaf redaction
 */
template<typename M>
concept RedactionMapper = requires(const M& mapper, int scalar, std::string text) {
    { mapper.map_scalar(scalar) } -> std::same_as<int>;
    { mapper.template map_sensitive<Secret>(std::move(text)) } -> std::same_as<std::string>;
};

/**
 * @brief Canonical mapper: Scalar Redaction + classification policy
 */
struct DefaultMapper {
    template<ScalarRedaction T>
    [[nodiscard]] constexpr T map_scalar(T value) const noexcept {
        return redact_scalar(value);
    }

    template<HasRedactionPolicy C, SensitiveValue T>
    [[nodiscard]] T map_sensitive(T value) const {
        using Traits = SensitiveValueTraits<T>;
        std::string redacted = policy_for<C>().apply_to(Traits::as_text(value));
        return Traits::from_redacted(std::move(redacted));
    }
};

static_assert(RedactionMapper<DefaultMapper>);

inline constexpr DefaultMapper kDefaultMapper{};

} // namespace redactor
