#pragma once

#include <concepts>
#include <string>
#include <string_view>
#include <type_traits>
#include <variant>

namespace redactor {

/**
 * @brief Borrowed-or-owned text
 *
 * Holds either a view into storage owned elsewhere or its own string.
 * Redaction always produces an owned value; the borrowed storage is never
 * written to.
 */
class MaybeOwnedText {
public:
    MaybeOwnedText() = default;

    [[nodiscard]] static MaybeOwnedText borrowed(std::string_view text) {
        MaybeOwnedText t;
        t.text_ = text;
        return t;
    }

    [[nodiscard]] static MaybeOwnedText owned(std::string text) {
        MaybeOwnedText t;
        t.text_ = std::move(text);
        return t;
    }

    [[nodiscard]] std::string_view view() const {
        if (const auto* s = std::get_if<std::string>(&text_)) {
            return *s;
        }
        return std::get<std::string_view>(text_);
    }

    [[nodiscard]] bool is_owned() const { return std::holds_alternative<std::string>(text_); }

    [[nodiscard]] std::string to_string() const { return std::string(view()); }

    bool operator==(const MaybeOwnedText& other) const { return view() == other.view(); }

private:
    std::variant<std::string_view, std::string> text_{std::string_view{}};
};

/*
 * SensitiveValueTraits<T> - the contract for string-like leaf types.
 *
 * A specialization provides:
 *   static std::string_view as_text(const T&)   read-only text view
 *   static T from_redacted(std::string)         rebuild from redacted text
 *
 * from_redacted need not preserve the original representation, only the
 * value. Scalars (numbers, bool, characters) are not sensitive values; they
 * go through redact_scalar() instead.
 *
 * For a string-like type from another library, specialize this trait for it
 * or wrap it in a local type and specialize for the wrapper.
 */
template<typename T>
struct SensitiveValueTraits;

template<>
struct SensitiveValueTraits<std::string> {
    static std::string_view as_text(const std::string& value) { return value; }
    static std::string from_redacted(std::string redacted) { return redacted; }
};

template<>
struct SensitiveValueTraits<MaybeOwnedText> {
    static std::string_view as_text(const MaybeOwnedText& value) { return value.view(); }
    static MaybeOwnedText from_redacted(std::string redacted) {
        return MaybeOwnedText::owned(std::move(redacted));
    }
};

template<typename T>
concept SensitiveValue = requires(const T& value, std::string redacted) {
    { SensitiveValueTraits<T>::as_text(value) } -> std::convertible_to<std::string_view>;
    { SensitiveValueTraits<T>::from_redacted(std::move(redacted)) } -> std::same_as<T>;
};

} // namespace redactor
