#pragma once

#include "core/utils.hpp"
#include "policy/text_policy.hpp"
#include "redact/sensitive_value.hpp"

#include <concepts>
#include <format>
#include <map>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <utility>

namespace redactor::debug {

// Selected per build configuration. Test builds define REDACTOR_TESTING to
// see real values in diagnostics; there is deliberately no runtime switch.
#ifdef REDACTOR_TESTING
inline constexpr bool kRenderUnredacted = true;
#else
inline constexpr bool kRenderUnredacted = false;
#endif

namespace detail {

template<typename T>
struct is_optional : std::false_type {};
template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template<typename T>
struct is_unique_ptr : std::false_type {};
template<typename T, typename D>
struct is_unique_ptr<std::unique_ptr<T, D>> : std::true_type {};

template<typename T>
concept MapLike = requires {
    typename T::key_type;
    typename T::mapped_type;
} && std::ranges::range<T>;

template<typename T>
concept Formattable = requires(const T& v) { std::format("{}", v); };

inline void append_quoted(std::string& out, std::string_view text) {
    out.push_back('"');
    for (char c : text) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\t': out += "\\t"; break;
            default:   out.push_back(c); break;
        }
    }
    out.push_back('"');
}

} // namespace detail

/**
 * @brief Debug representation of a value
 *
 * Strings quoted, optionals as None / Some(..), sequences as [..], maps as
 * {k: v}, null boxes as null. Types with a member debug_string() use it.
 */
template<typename T>
[[nodiscard]] std::string debug_repr(const T& value) {
    std::string out;
    if constexpr (std::same_as<T, bool>) {
        out = utils::booltostr(value);
    } else if constexpr (std::same_as<T, MaybeOwnedText>) {
        detail::append_quoted(out, value.view());
    } else if constexpr (std::convertible_to<const T&, std::string_view>) {
        detail::append_quoted(out, std::string_view(value));
    } else if constexpr (std::same_as<T, char>) {
        out = std::format("'{}'", value);
    } else if constexpr (std::is_arithmetic_v<T>) {
        out = std::format("{}", value);
    } else if constexpr (std::is_enum_v<T>) {
        out = std::format("{}", static_cast<std::underlying_type_t<T>>(value));
    } else if constexpr (detail::is_optional<T>::value) {
        out = value.has_value() ? "Some(" + debug_repr(*value) + ")" : "None";
    } else if constexpr (detail::is_unique_ptr<T>::value) {
        out = value ? debug_repr(*value) : "null";
    } else if constexpr (requires { { value.debug_string() } -> std::convertible_to<std::string>; }) {
        out = value.debug_string();
    } else if constexpr (detail::MapLike<T>) {
        out.push_back('{');
        bool first = true;
        for (const auto& [key, mapped] : value) {
            if (!first) out += ", ";
            first = false;
            out += debug_repr(key);
            out += ": ";
            out += debug_repr(mapped);
        }
        out.push_back('}');
    } else if constexpr (std::ranges::range<T>) {
        out.push_back('[');
        bool first = true;
        for (const auto& element : value) {
            if (!first) out += ", ";
            first = false;
            out += debug_repr(element);
        }
        out.push_back(']');
    } else {
        static_assert(detail::Formattable<T>, "debug_repr: no rendering for this type");
        out = std::format("{}", value);
    }
    return out;
}

/**
 * @brief Builder for `Name { a: 1, b: "x" }` renderings
 *
 * sensitive() fields render as the fixed placeholder unless the translation
 * unit is compiled with REDACTOR_TESTING.
 */
class DebugStruct {
public:
    explicit DebugStruct(std::string_view name) : out_(name) {}

    template<typename T>
    DebugStruct& field(std::string_view name, const T& value) {
        append_name(name);
        out_ += debug_repr(value);
        return *this;
    }

    template<typename T>
    DebugStruct& sensitive(std::string_view name, const T& value) {
        append_name(name);
        if constexpr (kRenderUnredacted) {
            out_ += debug_repr(value);
        } else {
            out_ += kRedactedPlaceholder;
        }
        return *this;
    }

    [[nodiscard]] std::string finish() const {
        if (field_count_ == 0) {
            return out_;
        }
        return out_ + " }";
    }

private:
    void append_name(std::string_view name) {
        out_ += (field_count_++ == 0) ? " { " : ", ";
        out_ += name;
        out_ += ": ";
    }

    std::string out_;
    size_t field_count_ = 0;
};

} // namespace redactor::debug
