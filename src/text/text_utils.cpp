#include "internal/text/text_utils.hpp"

#include <cstddef>
#include <cstdint>

#include <string>
#include <vector>

namespace vntn {
namespace text {

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

std::vector<std::string> splitUtf8(const std::string& str) {
    std::vector<std::string> result;
    for (size_t i = 0; i < str.length();) {
        size_t char_len = 1;
        unsigned char c = str[i];

        // Determine UTF-8 character length
        if ((c & 0x80) == 0) {
            char_len = 1;  // ASCII
        } else if ((c & 0xE0) == 0xC0) {
            char_len = 2;  // 2-byte UTF-8
        } else if ((c & 0xF0) == 0xE0) {
            char_len = 3;  // 3-byte UTF-8
        } else if ((c & 0xF8) == 0xF0) {
            char_len = 4;  // 4-byte UTF-8
        }

        // Keep a truncated tail as-is
        if (i + char_len > str.length()) {
            char_len = str.length() - i;
        }
        result.push_back(str.substr(i, char_len));
        i += char_len;
    }
    return result;
}

uint32_t decodeUtf8(const std::string& ch) {
    if (ch.empty()) return 0xFFFD;

    unsigned char c0 = ch[0];
    if ((c0 & 0x80) == 0) return c0;

    size_t len = 0;
    uint32_t cp = 0;
    if ((c0 & 0xE0) == 0xC0) {
        len = 2;
        cp = c0 & 0x1F;
    } else if ((c0 & 0xF0) == 0xE0) {
        len = 3;
        cp = c0 & 0x0F;
    } else if ((c0 & 0xF8) == 0xF0) {
        len = 4;
        cp = c0 & 0x07;
    } else {
        return 0xFFFD;
    }

    if (ch.length() < len) return 0xFFFD;
    for (size_t i = 1; i < len; ++i) {
        unsigned char c = ch[i];
        if ((c & 0xC0) != 0x80) return 0xFFFD;
        cp = (cp << 6) | (c & 0x3F);
    }
    return cp;
}

// =============================================================================
// 字符类型判断
// =============================================================================

namespace {

struct CodepointRange {
    uint32_t first;
    uint32_t last;
};

// Letter ranges above Greek, sorted by first codepoint.
// Vowel signs and other combining marks of the Indic scripts are left out.
const CodepointRange LETTER_RANGES[] = {
    {0x0400, 0x0481}, {0x048A, 0x052F},     // Cyrillic
    {0x0531, 0x0556}, {0x0561, 0x0587},     // Armenian
    {0x05D0, 0x05EA},                       // Hebrew
    {0x0620, 0x064A}, {0x066E, 0x066F},     // Arabic
    {0x0671, 0x06D3}, {0x06D5, 0x06D5},
    {0x06EE, 0x06EF}, {0x06FA, 0x06FC},
    {0x06FF, 0x06FF},
    {0x0710, 0x0710}, {0x0712, 0x072F},     // Syriac
    {0x0780, 0x07A5},                       // Thaana
    {0x0904, 0x0939}, {0x093D, 0x093D},     // Devanagari
    {0x0950, 0x0950}, {0x0958, 0x0961},
    {0x0971, 0x097F},
    {0x0985, 0x09B9}, {0x09BD, 0x09BD},     // Bengali
    {0x09CE, 0x09CE}, {0x09DC, 0x09E1},
    {0x0A05, 0x0A39},                       // Gurmukhi
    {0x0A85, 0x0AB9},                       // Gujarati
    {0x0B05, 0x0B39},                       // Oriya
    {0x0B85, 0x0BB9},                       // Tamil
    {0x0C05, 0x0C39},                       // Telugu
    {0x0C85, 0x0CB9},                       // Kannada
    {0x0D05, 0x0D3A},                       // Malayalam
    {0x0D85, 0x0DC6},                       // Sinhala
    {0x0E01, 0x0E30}, {0x0E32, 0x0E33},     // Thai
    {0x0E40, 0x0E46},
    {0x0E81, 0x0EB0}, {0x0EB2, 0x0EB3},     // Lao
    {0x0EBD, 0x0EC6},
    {0x0F40, 0x0F6C},                       // Tibetan
    {0x1000, 0x102A},                       // Myanmar
    {0x10A0, 0x10FA}, {0x10FC, 0x10FF},     // Georgian
    {0x1100, 0x11FF},                       // Hangul Jamo
    {0x1200, 0x135A},                       // Ethiopic
    {0x13A0, 0x13F5},                       // Cherokee
    {0x1780, 0x17B3},                       // Khmer
    {0x1E00, 0x1EFF},                       // Latin Extended Additional (ạ, ế, ồ, ữ, ...)
    {0x1F00, 0x1FBC},                       // Greek Extended
    {0x3041, 0x3096},                       // Hiragana
    {0x30A1, 0x30FA},                       // Katakana
    {0x3400, 0x4DBF},                       // CJK Extension A
    {0x4E00, 0x9FFF},                       // CJK
    {0xAC00, 0xD7A3},                       // Hangul syllables
    {0xFF21, 0xFF3A}, {0xFF41, 0xFF5A},     // Fullwidth Latin
};

}  // namespace

bool isLetterCodepoint(uint32_t cp) {
    if ((cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z')) return true;
    if (cp < 0x80) return false;

    // Latin-1 letters (excluding × and ÷) and ordinal indicators
    if (cp == 0xAA || cp == 0xB5 || cp == 0xBA) return true;
    if (cp >= 0xC0 && cp <= 0xFF) return cp != 0xD7 && cp != 0xF7;

    // Latin Extended-A/B, IPA, spacing modifier letters
    if (cp >= 0x0100 && cp <= 0x02C1) return true;

    // Greek and Coptic
    if (cp >= 0x0370 && cp <= 0x03FF) {
        return cp != 0x0375 && cp != 0x037E && cp != 0x0384 &&
            cp != 0x0385 && cp != 0x0387 && cp != 0x03F6;
    }

    for (const auto& range : LETTER_RANGES) {
        if (cp < range.first) return false;
        if (cp <= range.last) return true;
    }
    return false;
}

bool isWhitespaceChar(const std::string& ch) {
    uint32_t cp = decodeUtf8(ch);
    if (cp == ' ' || (cp >= 0x09 && cp <= 0x0D)) return true;
    if (cp >= 0x1C && cp <= 0x1F) return true;
    if (cp == 0x85 || cp == 0xA0 || cp == 0x1680) return true;
    if (cp >= 0x2000 && cp <= 0x200A) return true;
    return cp == 0x2028 || cp == 0x2029 || cp == 0x202F ||
        cp == 0x205F || cp == 0x3000;
}

bool isDigit(const std::string& ch) {
    if (ch.length() != 1) return false;
    char c = ch[0];
    return c >= '0' && c <= '9';
}

CharClass classifyChar(const std::string& ch) {
    if (isDigit(ch)) return CharClass::DIGIT;
    if (isLetterCodepoint(decodeUtf8(ch))) return CharClass::LETTER;
    return CharClass::OTHER;
}

// =============================================================================
// 预处理
// =============================================================================

std::string collapseWhitespace(const std::string& text) {
    std::string result;
    result.reserve(text.length());

    bool pending_space = false;
    for (const auto& ch : splitUtf8(text)) {
        if (isWhitespaceChar(ch)) {
            pending_space = true;
            continue;
        }
        // Leading whitespace is dropped, inner runs become one space
        if (pending_space && !result.empty()) {
            result += ' ';
        }
        pending_space = false;
        result += ch;
    }
    return result;
}

std::string separateAlphanumeric(const std::string& text) {
    std::string result;
    result.reserve(text.length() + text.length() / 4);

    CharClass current = CharClass::OTHER;
    for (const auto& ch : splitUtf8(text)) {
        CharClass next = classifyChar(ch);

        if (current != CharClass::OTHER && next != CharClass::OTHER && next != current) {
            result += ' ';
        }

        result += ch;
        current = next;
    }
    return result;
}

std::string splitSeparators(const std::string& text, bool keep_digit_hyphens) {
    std::string result = text;
    auto is_ascii_digit = [](char c) { return c >= '0' && c <= '9'; };

    for (size_t i = 0; i < result.length(); ++i) {
        if (result[i] == '_') {
            result[i] = ' ';
        } else if (result[i] == '-') {
            bool between_digits = i > 0 && i + 1 < result.length() &&
                is_ascii_digit(text[i - 1]) && is_ascii_digit(text[i + 1]);
            if (!keep_digit_hyphens || !between_digits) {
                result[i] = ' ';
            }
        }
    }
    return result;
}

// =============================================================================
// 数字片段扫描
// =============================================================================

namespace {

bool isAsciiDigitByte(char c) {
    return c >= '0' && c <= '9';
}

// Same notion of a word character as the regex \b in the C locale
bool isWordByte(char c) {
    return isAsciiDigitByte(c) || c == '_' ||
        (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool isAsciiSpaceByte(char c) {
    return c == ' ' || (c >= '\t' && c <= '\r');
}

size_t digitRunEnd(const std::string& text, size_t pos) {
    while (pos < text.length() && isAsciiDigitByte(text[pos])) {
        ++pos;
    }
    return pos;
}

}  // namespace

std::vector<DecimalSpan> findDecimalSpans(const std::string& text, char separator) {
    std::vector<DecimalSpan> spans;

    size_t i = 0;
    while (i < text.length()) {
        if (!isAsciiDigitByte(text[i])) {
            ++i;
            continue;
        }

        size_t int_start = i;
        size_t int_end = digitRunEnd(text, i);
        bool left_boundary = int_start == 0 || !isWordByte(text[int_start - 1]);

        if (left_boundary && int_end + 1 < text.length() &&
            text[int_end] == separator && isAsciiDigitByte(text[int_end + 1])) {
            size_t frac_start = int_end + 1;
            size_t frac_end = digitRunEnd(text, frac_start);

            if (frac_end == text.length() || !isWordByte(text[frac_end])) {
                spans.push_back({int_start, frac_end - int_start,
                                 text.substr(int_start, int_end - int_start),
                                 text.substr(frac_start, frac_end - frac_start)});
                i = frac_end;
                continue;
            }
        }

        // The fraction run may still start a match of its own
        i = int_end;
    }
    return spans;
}

std::string spaceDigitsBeforeSymbols(const std::string& text) {
    std::string result;
    result.reserve(text.length() + text.length() / 8);

    for (size_t i = 0; i < text.length(); ++i) {
        result += text[i];
        if (isAsciiDigitByte(text[i]) && i + 1 < text.length() &&
            !isAsciiDigitByte(text[i + 1]) && !isAsciiSpaceByte(text[i + 1])) {
            result += ' ';
        }
    }
    return result;
}

}  // namespace text
}  // namespace vntn
