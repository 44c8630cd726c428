#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <variant>

namespace redactor {

/// Default placeholder used for full redaction.
inline constexpr std::string_view kRedactedPlaceholder = "[REDACTED]";

inline constexpr char32_t kDefaultMaskChar = U'*';

/**
 * @brief Keep selected segments visible, mask the remainder
 *
 * Counts are Unicode scalar values. If visible_prefix + visible_suffix
 * covers the whole value, the value is returned unchanged.
 */
class KeepConfig {
public:
    [[nodiscard]] static KeepConfig first(size_t visible_prefix) {
        return KeepConfig(visible_prefix, 0);
    }

    [[nodiscard]] static KeepConfig last(size_t visible_suffix) {
        return KeepConfig(0, visible_suffix);
    }

    [[nodiscard]] static KeepConfig both(size_t visible_prefix, size_t visible_suffix) {
        return KeepConfig(visible_prefix, visible_suffix);
    }

    [[nodiscard]] KeepConfig with_mask_char(char32_t mask_char) const {
        KeepConfig copy = *this;
        copy.mask_char_ = mask_char;
        return copy;
    }

    [[nodiscard]] size_t visible_prefix() const { return visible_prefix_; }
    [[nodiscard]] size_t visible_suffix() const { return visible_suffix_; }
    [[nodiscard]] char32_t mask_char() const { return mask_char_; }

    [[nodiscard]] std::string apply_to(std::string_view value) const;

    bool operator==(const KeepConfig&) const = default;

private:
    KeepConfig(size_t visible_prefix, size_t visible_suffix)
        : visible_prefix_(visible_prefix), visible_suffix_(visible_suffix) {}

    size_t visible_prefix_;
    size_t visible_suffix_;
    char32_t mask_char_ = kDefaultMaskChar;
};

/**
 * @brief Mask selected segments, leave the remainder unchanged
 *
 * If mask_prefix + mask_suffix covers the whole value, every scalar
 * value is masked.
 */
class MaskConfig {
public:
    [[nodiscard]] static MaskConfig first(size_t mask_prefix) {
        return MaskConfig(mask_prefix, 0);
    }

    [[nodiscard]] static MaskConfig last(size_t mask_suffix) {
        return MaskConfig(0, mask_suffix);
    }

    [[nodiscard]] static MaskConfig both(size_t mask_prefix, size_t mask_suffix) {
        return MaskConfig(mask_prefix, mask_suffix);
    }

    [[nodiscard]] MaskConfig with_mask_char(char32_t mask_char) const {
        MaskConfig copy = *this;
        copy.mask_char_ = mask_char;
        return copy;
    }

    [[nodiscard]] size_t mask_prefix() const { return mask_prefix_; }
    [[nodiscard]] size_t mask_suffix() const { return mask_suffix_; }
    [[nodiscard]] char32_t mask_char() const { return mask_char_; }

    [[nodiscard]] std::string apply_to(std::string_view value) const;

    bool operator==(const MaskConfig&) const = default;

private:
    MaskConfig(size_t mask_prefix, size_t mask_suffix)
        : mask_prefix_(mask_prefix), mask_suffix_(mask_suffix) {}

    size_t mask_prefix_;
    size_t mask_suffix_;
    char32_t mask_char_ = kDefaultMaskChar;
};

/**
 * @brief Replace the entire value with a fixed placeholder
 */
struct FullConfig {
    std::string placeholder{kRedactedPlaceholder};

    bool operator==(const FullConfig&) const = default;
};

/**
 * @brief A redaction strategy for string-like values
 *
 * Policies are pure string transformations:
 * - FULL: replace with a placeholder (never empty, even for empty input)
 * - KEEP: keep prefix/suffix visible, mask the middle
 * - MASK: mask prefix/suffix, keep the middle
 *
 * apply_to() is total and deterministic. Input is UTF-8; counts and slices
 * are in Unicode scalar values, so multi-byte characters are never split.
 */
class TextRedactionPolicy {
public:
    enum class Kind { FULL, KEEP, MASK };

    TextRedactionPolicy() = default;

    [[nodiscard]] static TextRedactionPolicy default_full() {
        return TextRedactionPolicy(FullConfig{});
    }

    [[nodiscard]] static TextRedactionPolicy full_with(std::string placeholder) {
        return TextRedactionPolicy(FullConfig{std::move(placeholder)});
    }

    [[nodiscard]] static TextRedactionPolicy keep_with(KeepConfig config) {
        return TextRedactionPolicy(config);
    }

    [[nodiscard]] static TextRedactionPolicy keep_first(size_t visible_prefix) {
        return keep_with(KeepConfig::first(visible_prefix));
    }

    [[nodiscard]] static TextRedactionPolicy keep_last(size_t visible_suffix) {
        return keep_with(KeepConfig::last(visible_suffix));
    }

    [[nodiscard]] static TextRedactionPolicy mask_with(MaskConfig config) {
        return TextRedactionPolicy(config);
    }

    [[nodiscard]] static TextRedactionPolicy mask_first(size_t mask_prefix) {
        return mask_with(MaskConfig::first(mask_prefix));
    }

    [[nodiscard]] static TextRedactionPolicy mask_last(size_t mask_suffix) {
        return mask_with(MaskConfig::last(mask_suffix));
    }

    /**
     * @brief Override the masking character of a KEEP or MASK policy
     *
     * Has no effect on FULL, which never masks individual characters.
     */
    [[nodiscard]] TextRedactionPolicy with_mask_char(char32_t mask_char) const;

    [[nodiscard]] std::string apply_to(std::string_view value) const;

    [[nodiscard]] Kind kind() const;

    // Typed access; nullptr if the policy is of another kind
    [[nodiscard]] const FullConfig* as_full() const { return std::get_if<FullConfig>(&config_); }
    [[nodiscard]] const KeepConfig* as_keep() const { return std::get_if<KeepConfig>(&config_); }
    [[nodiscard]] const MaskConfig* as_mask() const { return std::get_if<MaskConfig>(&config_); }

    /**
     * @brief Human-readable description, e.g. "keep(prefix=0, suffix=4, mask='*')"
     */
    [[nodiscard]] std::string describe() const;

    bool operator==(const TextRedactionPolicy&) const = default;

private:
    using Config = std::variant<FullConfig, KeepConfig, MaskConfig>;

    explicit TextRedactionPolicy(Config config) : config_(std::move(config)) {}

    Config config_{FullConfig{}};
};

inline const char* policy_kind_to_string(TextRedactionPolicy::Kind kind) {
    switch (kind) {
        case TextRedactionPolicy::Kind::FULL: return "full";
        case TextRedactionPolicy::Kind::KEEP: return "keep";
        case TextRedactionPolicy::Kind::MASK: return "mask";
    }
    return "unknown";
}

} // namespace redactor
