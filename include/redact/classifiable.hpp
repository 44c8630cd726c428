#pragma once

#include "policy/redaction_policy.hpp"
#include "redact/mapper.hpp"
#include "redact/sensitive_value.hpp"

#include <map>
#include <memory>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace redactor {

/*
===============================================================================
Classifiable<T> - apply a classification through wrapper layers
===============================================================================

A classified field may be a bare leaf (std::string) or a leaf wrapped in any
finite stack of optional / vector / unique_ptr / map layers, e.g.
std::optional<std::vector<std::string>>. Each specialization below peels
exactly one layer and hands the held type back to Classifiable<>, so the
composition of specializations covers any nesting depth.

Each specialization provides:

  template<HasRedactionPolicy C, RedactionMapper M>
  static T apply(T value, const M& mapper);

Rules:
  - The primary template is intentionally undefined
  - Wrappers preserve structure: absent stays absent, order and count are
    kept, map keys are never touched
  - Only the leaf (SensitiveValue) calls into the mapper

Adding a wrapper shape: specialize Classifiable for it, constrained on
ClassifiableType for the held type, and recurse through Classifiable<Held>.
===============================================================================
*/

template<typename T>
struct Classifiable;

template<typename T>
concept ClassifiableType = requires { sizeof(Classifiable<T>); };

// Leaf: the policy is applied here
template<SensitiveValue T>
struct Classifiable<T> {
    template<HasRedactionPolicy C, RedactionMapper M>
    static T apply(T value, const M& mapper) {
        return mapper.template map_sensitive<C>(std::move(value));
    }
};

template<ClassifiableType T>
struct Classifiable<std::optional<T>> {
    template<HasRedactionPolicy C, RedactionMapper M>
    static std::optional<T> apply(std::optional<T> value, const M& mapper) {
        if (!value.has_value()) {
            return std::nullopt;
        }
        return Classifiable<T>::template apply<C>(std::move(*value), mapper);
    }
};

template<ClassifiableType T, typename Alloc>
struct Classifiable<std::vector<T, Alloc>> {
    template<HasRedactionPolicy C, RedactionMapper M>
    static std::vector<T, Alloc> apply(std::vector<T, Alloc> values, const M& mapper) {
        for (auto& element : values) {
            element = Classifiable<T>::template apply<C>(std::move(element), mapper);
        }
        return values;
    }
};

template<ClassifiableType T, typename Deleter>
struct Classifiable<std::unique_ptr<T, Deleter>> {
    template<HasRedactionPolicy C, RedactionMapper M>
    static std::unique_ptr<T, Deleter> apply(std::unique_ptr<T, Deleter> boxed, const M& mapper) {
        if (boxed) {
            *boxed = Classifiable<T>::template apply<C>(std::move(*boxed), mapper);
        }
        return boxed;
    }
};

// Maps: values only. Keys are never redacted, even when the key type is
// itself classifiable.
template<typename K, ClassifiableType V, typename Compare, typename Alloc>
struct Classifiable<std::map<K, V, Compare, Alloc>> {
    template<HasRedactionPolicy C, RedactionMapper M>
    static std::map<K, V, Compare, Alloc> apply(std::map<K, V, Compare, Alloc> entries,
                                                const M& mapper) {
        for (auto& [key, value] : entries) {
            value = Classifiable<V>::template apply<C>(std::move(value), mapper);
        }
        return entries;
    }
};

template<typename K, ClassifiableType V, typename Hash, typename KeyEqual, typename Alloc>
struct Classifiable<std::unordered_map<K, V, Hash, KeyEqual, Alloc>> {
    using Map = std::unordered_map<K, V, Hash, KeyEqual, Alloc>;

    template<HasRedactionPolicy C, RedactionMapper M>
    static Map apply(Map entries, const M& mapper) {
        for (auto& [key, value] : entries) {
            value = Classifiable<V>::template apply<C>(std::move(value), mapper);
        }
        return entries;
    }
};

/**
 * @brief Apply classification C's policy at the leaf of @p value
 */
template<HasRedactionPolicy C, ClassifiableType T, RedactionMapper M>
[[nodiscard]] T apply_classification(T value, const M& mapper) {
    return Classifiable<T>::template apply<C>(std::move(value), mapper);
}

template<HasRedactionPolicy C, ClassifiableType T>
[[nodiscard]] T apply_classification(T value) {
    return apply_classification<C>(std::move(value), kDefaultMapper);
}

} // namespace redactor
