#include "core/utf8.hpp"

namespace redactor::utf8 {

namespace {

constexpr bool is_continuation(unsigned char byte) noexcept {
    return (byte & 0xC0) == 0x80;
}

constexpr bool is_surrogate(char32_t cp) noexcept {
    return cp >= 0xD800 && cp <= 0xDFFF;
}

} // anonymous namespace

char32_t decode(std::string_view text, size_t& pos) noexcept {
    const auto lead = static_cast<unsigned char>(text[pos]);

    if (lead < 0x80) {
        ++pos;
        return lead;
    }

    size_t length = 0;
    char32_t cp = 0;
    char32_t min_cp = 0;
    if ((lead & 0xE0) == 0xC0) {
        length = 2;
        cp = lead & 0x1F;
        min_cp = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3;
        cp = lead & 0x0F;
        min_cp = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4;
        cp = lead & 0x07;
        min_cp = 0x10000;
    } else {
        ++pos;
        return kReplacementChar;
    }

    if (pos + length > text.size()) {
        ++pos;
        return kReplacementChar;
    }

    for (size_t i = 1; i < length; ++i) {
        const auto byte = static_cast<unsigned char>(text[pos + i]);
        if (!is_continuation(byte)) {
            ++pos;
            return kReplacementChar;
        }
        cp = (cp << 6) | (byte & 0x3F);
    }

    // Overlong forms, surrogates and out-of-range values are not scalars
    if (cp < min_cp || cp > kMaxCodePoint || is_surrogate(cp)) {
        ++pos;
        return kReplacementChar;
    }

    pos += length;
    return cp;
}

size_t encoded_size(char32_t cp) noexcept {
    if (cp < 0x80) return 1;
    if (cp < 0x800) return 2;
    if (is_surrogate(cp) || cp > kMaxCodePoint) return 3;  // U+FFFD
    if (cp < 0x10000) return 3;
    return 4;
}

void append(std::string& out, char32_t cp) {
    if (is_surrogate(cp) || cp > kMaxCodePoint) {
        cp = kReplacementChar;
    }
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

size_t scalar_count(std::string_view text) noexcept {
    size_t count = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        (void)decode(text, pos);
        ++count;
    }
    return count;
}

bool is_valid(std::string_view text) noexcept {
    size_t pos = 0;
    while (pos < text.size()) {
        const size_t start = pos;
        const char32_t cp = decode(text, pos);
        // A genuine U+FFFD in the input is three bytes long
        if (cp == kReplacementChar && pos - start == 1) {
            return false;
        }
    }
    return true;
}

std::string encode(char32_t cp) {
    std::string out;
    append(out, cp);
    return out;
}

} // namespace redactor::utf8
