#pragma once

#include <concepts>
#include <memory>

namespace redactor {

/**
 * @brief Hook for polymorphic values held through std::unique_ptr<Base>
 *
 * The static type behind a unique_ptr<Base> says nothing about which fields
 * of the dynamic type are sensitive, so the object redacts itself. Derived
 * classes typically implement the hook with
 *
 *   void redact_boxed() override { *this = redactor::redact(std::move(*this)); }
 *
 * Container traversal prefers this hook over static traversal whenever the
 * pointee type derives from RedactableBoxed.
 */
class RedactableBoxed {
public:
    virtual ~RedactableBoxed() = default;

    /**
     * @brief Redact this object in place
     */
    virtual void redact_boxed() = 0;

protected:
    RedactableBoxed() = default;
    RedactableBoxed(const RedactableBoxed&) = default;
    RedactableBoxed& operator=(const RedactableBoxed&) = default;
    RedactableBoxed(RedactableBoxed&&) = default;
    RedactableBoxed& operator=(RedactableBoxed&&) = default;
};

/**
 * @brief Redact a boxed polymorphic value; null stays null
 */
template<typename T, typename Deleter>
    requires std::derived_from<T, RedactableBoxed>
[[nodiscard]] std::unique_ptr<T, Deleter> redact_boxed(std::unique_ptr<T, Deleter> value) {
    if (value) {
        value->redact_boxed();
    }
    return value;
}

} // namespace redactor
