#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace redactor::utf8 {

inline constexpr char32_t kReplacementChar = U'\uFFFD';
inline constexpr char32_t kMaxCodePoint = 0x10FFFF;

/**
 * @brief Decode one Unicode scalar value starting at @p pos
 *
 * Advances @p pos past the decoded sequence. A malformed, overlong,
 * surrogate or truncated sequence consumes exactly one byte and yields
 * U+FFFD, so every byte of the input belongs to exactly one scalar.
 *
 * @pre pos < text.size()
 */
[[nodiscard]] char32_t decode(std::string_view text, size_t& pos) noexcept;

/**
 * @brief Append the UTF-8 encoding of @p cp to @p out
 *
 * Surrogates and values above U+10FFFF are written as U+FFFD.
 */
void append(std::string& out, char32_t cp);

/**
 * @brief Number of bytes append() writes for @p cp
 */
[[nodiscard]] size_t encoded_size(char32_t cp) noexcept;

/**
 * @brief Count Unicode scalar values (decode() steps) in @p text
 */
[[nodiscard]] size_t scalar_count(std::string_view text) noexcept;

/**
 * @brief True if @p text is well-formed UTF-8
 */
[[nodiscard]] bool is_valid(std::string_view text) noexcept;

/**
 * @brief Encode a single scalar as a UTF-8 string
 */
[[nodiscard]] std::string encode(char32_t cp);

} // namespace redactor::utf8
