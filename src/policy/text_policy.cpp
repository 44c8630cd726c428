#include "policy/text_policy.hpp"
#include "core/utf8.hpp"

#include <format>

namespace redactor {

namespace {

/**
 * @brief Copy one decoded scalar from the input to the output
 *
 * Well-formed sequences are copied byte-for-byte; a stray byte that decoded
 * to U+FFFD is written as a real U+FFFD so the output stays valid UTF-8.
 */
void append_original(std::string& out, std::string_view value,
                     size_t start, size_t end, char32_t cp) {
    if (cp == utf8::kReplacementChar && end - start == 1) {
        utf8::append(out, utf8::kReplacementChar);
    } else {
        out.append(value.data() + start, end - start);
    }
}

// Overflow-safe "prefix + suffix >= total"
constexpr bool windows_cover(size_t prefix, size_t suffix, size_t total) {
    return prefix >= total || suffix >= total - prefix;
}

/**
 * @brief Rewrite @p value, masking every scalar whose index satisfies @p masked
 */
template<typename Predicate>
std::string rewrite(std::string_view value, size_t total, size_t masked_count,
                    char32_t mask_char, Predicate masked) {
    std::string result;
    result.reserve(value.size() + masked_count * utf8::encoded_size(mask_char));

    size_t pos = 0;
    size_t index = 0;
    while (pos < value.size()) {
        const size_t start = pos;
        const char32_t cp = utf8::decode(value, pos);
        if (masked(index, total)) {
            utf8::append(result, mask_char);
        } else {
            append_original(result, value, start, pos, cp);
        }
        ++index;
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// KeepConfig
// ============================================================================

std::string KeepConfig::apply_to(std::string_view value) const {
    const size_t total = utf8::scalar_count(value);
    if (total == 0) {
        return std::string();
    }

    // Keep windows cover everything: nothing to mask
    if (windows_cover(visible_prefix_, visible_suffix_, total)) {
        return rewrite(value, total, 0, mask_char_,
                       [](size_t, size_t) { return false; });
    }

    const size_t prefix = visible_prefix_;
    const size_t suffix = visible_suffix_;
    return rewrite(value, total, total - prefix - suffix, mask_char_,
                   [prefix, suffix](size_t i, size_t n) {
                       return i >= prefix && i < n - suffix;
                   });
}

// ============================================================================
// MaskConfig
// ============================================================================

std::string MaskConfig::apply_to(std::string_view value) const {
    const size_t total = utf8::scalar_count(value);
    if (total == 0) {
        return std::string();
    }

    // Mask windows cover everything: mask every scalar
    if (windows_cover(mask_prefix_, mask_suffix_, total)) {
        std::string result;
        result.reserve(total * utf8::encoded_size(mask_char_));
        for (size_t i = 0; i < total; ++i) {
            utf8::append(result, mask_char_);
        }
        return result;
    }

    const size_t prefix = mask_prefix_;
    const size_t suffix = mask_suffix_;
    return rewrite(value, total, prefix + suffix, mask_char_,
                   [prefix, suffix](size_t i, size_t n) {
                       return i < prefix || i >= n - suffix;
                   });
}

// ============================================================================
// TextRedactionPolicy
// ============================================================================

TextRedactionPolicy TextRedactionPolicy::with_mask_char(char32_t mask_char) const {
    TextRedactionPolicy copy = *this;
    if (auto* keep = std::get_if<KeepConfig>(&copy.config_)) {
        *keep = keep->with_mask_char(mask_char);
    } else if (auto* mask = std::get_if<MaskConfig>(&copy.config_)) {
        *mask = mask->with_mask_char(mask_char);
    }
    return copy;
}

std::string TextRedactionPolicy::apply_to(std::string_view value) const {
    switch (kind()) {
        case Kind::FULL:
            return std::get<FullConfig>(config_).placeholder;
        case Kind::KEEP:
            return std::get<KeepConfig>(config_).apply_to(value);
        case Kind::MASK:
            return std::get<MaskConfig>(config_).apply_to(value);
    }
    return std::string(kRedactedPlaceholder);
}

TextRedactionPolicy::Kind TextRedactionPolicy::kind() const {
    switch (config_.index()) {
        case 1: return Kind::KEEP;
        case 2: return Kind::MASK;
        default: return Kind::FULL;
    }
}

std::string TextRedactionPolicy::describe() const {
    switch (kind()) {
        case Kind::FULL:
            return std::format("full(placeholder=\"{}\")",
                               std::get<FullConfig>(config_).placeholder);
        case Kind::KEEP: {
            const auto& keep = std::get<KeepConfig>(config_);
            return std::format("keep(prefix={}, suffix={}, mask='{}')",
                               keep.visible_prefix(), keep.visible_suffix(),
                               utf8::encode(keep.mask_char()));
        }
        case Kind::MASK: {
            const auto& mask = std::get<MaskConfig>(config_);
            return std::format("mask(prefix={}, suffix={}, mask='{}')",
                               mask.mask_prefix(), mask.mask_suffix(),
                               utf8::encode(mask.mask_char()));
        }
    }
    return "unknown";
}

} // namespace redactor
