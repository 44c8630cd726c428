#pragma once

#include "redact/mapper.hpp"
#include "redact/redactable_boxed.hpp"
#include "redact/scalar_redaction.hpp"
#include "redact/sensitive_value.hpp"

#include <concepts>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <type_traits>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <variant>
#include <vector>

namespace redactor {

/*
===============================================================================
SensitiveType<T> - structural walk of values that contain sensitive data
===============================================================================

Each specialization provides:

  template<RedactionMapper M>
  static T redact_with(T value, const M& mapper);

Shapes covered here:
  - leaves (scalars, text, enums, std::monostate): returned unchanged; only
    a field-level walk/classify transforms them (see field_ops.hpp)
  - std::optional, std::variant (either: the active alternative is walked),
    std::vector, std::unique_ptr, std::map / std::unordered_map (values)
  - std::set / std::unordered_set: every member is walked and re-inserted;
    members that become equal after redaction collapse into one
  - composites: any type with a member
        template<RedactionMapper M> T redact_with(const M&) &&
    normally produced by the code generator from field annotations

Rules:
  - The primary template is intentionally undefined; walking an unsupported
    type is a compile error, never a runtime one
  - Traversal is total and preserves structure
===============================================================================
*/

template<typename T>
struct SensitiveType;

template<typename T>
concept SensitiveTypeOf = requires { sizeof(SensitiveType<T>); };

/**
 * @brief Composite types that carry their own (generated) redact_with member
 */
template<typename T>
concept SelfRedacting = requires(T&& value, const DefaultMapper& mapper) {
    { std::move(value).redact_with(mapper) } -> std::same_as<T>;
};

/**
 * @brief Leaf types that container traversal returns unchanged
 */
template<typename T>
concept PassThroughLeaf =
    ScalarRedaction<T> ||
    std::is_enum_v<T> ||
    std::same_as<T, std::string> ||
    std::same_as<T, std::string_view> ||
    std::same_as<T, MaybeOwnedText> ||
    std::same_as<T, std::monostate>;

template<PassThroughLeaf T>
struct SensitiveType<T> {
    template<RedactionMapper M>
    static T redact_with(T value, const M& /*mapper*/) {
        return value;
    }
};

template<SelfRedacting T>
    requires (!PassThroughLeaf<T>)
struct SensitiveType<T> {
    template<RedactionMapper M>
    static T redact_with(T value, const M& mapper) {
        return std::move(value).redact_with(mapper);
    }
};

template<SensitiveTypeOf T>
struct SensitiveType<std::optional<T>> {
    template<RedactionMapper M>
    static std::optional<T> redact_with(std::optional<T> value, const M& mapper) {
        if (!value.has_value()) {
            return std::nullopt;
        }
        return SensitiveType<T>::redact_with(std::move(*value), mapper);
    }
};

// Result/either shapes: whichever alternative is held gets walked. The
// alternative is rebuilt by index, so std::variant<S, S> keeps its arm.
template<SensitiveTypeOf... Ts>
struct SensitiveType<std::variant<Ts...>> {
    using Variant = std::variant<Ts...>;

    template<RedactionMapper M>
    static Variant redact_with(Variant value, const M& mapper) {
        if (value.valueless_by_exception()) {
            return value;
        }
        return redact_held(std::move(value), mapper, std::index_sequence_for<Ts...>{});
    }

private:
    template<size_t I, RedactionMapper M>
    static Variant redact_arm(Variant&& value, const M& mapper) {
        using Held = std::variant_alternative_t<I, Variant>;
        return Variant(std::in_place_index<I>,
                       SensitiveType<Held>::redact_with(std::get<I>(std::move(value)), mapper));
    }

    template<RedactionMapper M, size_t... Is>
    static Variant redact_held(Variant value, const M& mapper, std::index_sequence<Is...>) {
        using Arm = Variant (*)(Variant&&, const M&);
        static constexpr Arm arms[] = {&redact_arm<Is, M>...};
        return arms[value.index()](std::move(value), mapper);
    }
};

template<SensitiveTypeOf T, typename Alloc>
struct SensitiveType<std::vector<T, Alloc>> {
    template<RedactionMapper M>
    static std::vector<T, Alloc> redact_with(std::vector<T, Alloc> values, const M& mapper) {
        for (auto& element : values) {
            element = SensitiveType<T>::redact_with(std::move(element), mapper);
        }
        return values;
    }
};

template<typename T, typename Deleter>
    requires SensitiveTypeOf<T> || std::derived_from<T, RedactableBoxed>
struct SensitiveType<std::unique_ptr<T, Deleter>> {
    template<RedactionMapper M>
    static std::unique_ptr<T, Deleter> redact_with(std::unique_ptr<T, Deleter> boxed,
                                                   const M& mapper) {
        if constexpr (std::derived_from<T, RedactableBoxed>) {
            // Dynamic type decides which fields are sensitive
            return redact_boxed(std::move(boxed));
        } else {
            if (boxed) {
                *boxed = SensitiveType<T>::redact_with(std::move(*boxed), mapper);
            }
            return boxed;
        }
    }
};

template<typename K, SensitiveTypeOf V, typename Compare, typename Alloc>
struct SensitiveType<std::map<K, V, Compare, Alloc>> {
    using Map = std::map<K, V, Compare, Alloc>;

    template<RedactionMapper M>
    static Map redact_with(Map entries, const M& mapper) {
        for (auto& [key, value] : entries) {
            value = SensitiveType<V>::redact_with(std::move(value), mapper);
        }
        return entries;
    }
};

template<typename K, SensitiveTypeOf V, typename Hash, typename KeyEqual, typename Alloc>
struct SensitiveType<std::unordered_map<K, V, Hash, KeyEqual, Alloc>> {
    using Map = std::unordered_map<K, V, Hash, KeyEqual, Alloc>;

    template<RedactionMapper M>
    static Map redact_with(Map entries, const M& mapper) {
        for (auto& [key, value] : entries) {
            value = SensitiveType<V>::redact_with(std::move(value), mapper);
        }
        return entries;
    }
};

// Sets: members are walked and re-inserted with the original comparator or
// hasher. A string member is a pass-through leaf, so std::set<std::string>
// comes back unchanged.
template<SensitiveTypeOf K, typename Compare, typename Alloc>
struct SensitiveType<std::set<K, Compare, Alloc>> {
    using Set = std::set<K, Compare, Alloc>;

    template<RedactionMapper M>
    static Set redact_with(Set members, const M& mapper) {
        Set result(members.key_comp(), members.get_allocator());
        while (!members.empty()) {
            auto node = members.extract(members.begin());
            result.insert(SensitiveType<K>::redact_with(std::move(node.value()), mapper));
        }
        return result;
    }
};

template<SensitiveTypeOf K, typename Hash, typename KeyEqual, typename Alloc>
struct SensitiveType<std::unordered_set<K, Hash, KeyEqual, Alloc>> {
    using Set = std::unordered_set<K, Hash, KeyEqual, Alloc>;

    template<RedactionMapper M>
    static Set redact_with(Set members, const M& mapper) {
        Set result(members.bucket_count(), members.hash_function(), members.key_eq(),
                   members.get_allocator());
        while (!members.empty()) {
            auto node = members.extract(members.begin());
            result.insert(SensitiveType<K>::redact_with(std::move(node.value()), mapper));
        }
        return result;
    }
};

} // namespace redactor
