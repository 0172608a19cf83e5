#include "internal/text/number_utils.hpp"

#include <cstdint>

#include <iostream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace vntn {
namespace text {

namespace {

const char* DIGIT_WORDS[] = {
    "không", "một", "hai", "ba", "bốn",
    "năm", "sáu", "bảy", "tám", "chín"
};

const char* TEN_WORD = "mười";

const char* SCALE_UNITS[] = {
    "", "nghìn", "triệu", "tỷ", "nghìn tỷ", "triệu tỷ", "tỷ tỷ"
};

const std::unordered_map<std::string, const char*> MONTH_WORDS = {
    {"01", "một"}, {"1", "một"},
    {"02", "hai"}, {"2", "hai"},
    {"03", "ba"}, {"3", "ba"},
    {"04", "tư"}, {"4", "tư"},
    {"05", "năm"}, {"5", "năm"},
    {"06", "sáu"}, {"6", "sáu"},
    {"07", "bảy"}, {"7", "bảy"},
    {"08", "tám"}, {"8", "tám"},
    {"09", "chín"}, {"9", "chín"},
    {"10", "mười"},
    {"11", "mười một"},
    {"12", "mười hai"},
};

// Tens and ones of a 0-99 remainder that follows "trăm" or stands alone (>= 10)
std::string tensToVietnamese(int tens, int ones) {
    std::string result = (tens == 1)
        ? std::string(TEN_WORD)
        : std::string(DIGIT_WORDS[tens]) + " mươi";
    if (ones != 0) {
        result += " ";
        result += onesDigitWord(ones, true);
    }
    return result;
}

}  // namespace

// =============================================================================
// Lexical tables
// =============================================================================

const char* digitWord(int digit) {
    if (digit < 0 || digit > 9) return "";
    return DIGIT_WORDS[digit];
}

const char* onesDigitWord(int digit, bool in_tens_position) {
    if (in_tens_position) {
        switch (digit) {
            case 1: return "mốt";
            case 4: return "tư";
            case 5: return "lăm";
            default: break;
        }
    }
    return digitWord(digit);
}

const char* scaleUnitWord(size_t position) {
    if (position >= scaleUnitCount()) return "";
    return SCALE_UNITS[position];
}

size_t scaleUnitCount() {
    return sizeof(SCALE_UNITS) / sizeof(SCALE_UNITS[0]);
}

const char* monthWord(const std::string& month) {
    auto it = MONTH_WORDS.find(month);
    return it != MONTH_WORDS.end() ? it->second : nullptr;
}

// =============================================================================
// Digit strings
// =============================================================================

bool isAsciiDigits(const std::string& str) {
    if (str.empty()) return false;
    for (char c : str) {
        if (c < '0' || c > '9') return false;
    }
    return true;
}

std::string stripLeadingZeros(const std::string& str) {
    size_t first = str.find_first_not_of('0');
    if (first == std::string::npos) return "";
    return str.substr(first);
}

// =============================================================================
// Vietnamese number reading
// =============================================================================

std::string smallNumberToVietnamese(int num) {
    if (num < 0 || num > 999) return std::to_string(num);

    if (num < 10) return DIGIT_WORDS[num];
    if (num < 100) return tensToVietnamese(num / 10, num % 10);

    int hundreds = num / 100;
    int remainder = num % 100;

    std::string result = std::string(DIGIT_WORDS[hundreds]) + " trăm";
    if (remainder == 0) {
        return result;
    }
    if (remainder < 10) {
        // Empty tens position
        return result + " lẻ " + DIGIT_WORDS[remainder];
    }
    return result + " " + tensToVietnamese(remainder / 10, remainder % 10);
}

std::vector<NumberGroup> splitNumberGroups(uint64_t num) {
    std::vector<NumberGroup> groups;
    size_t position = 0;
    do {
        groups.push_back({static_cast<int>(num % 1000), position++});
        num /= 1000;
    } while (num > 0);
    return groups;
}

std::string groupedNumberToVietnamese(uint64_t num, bool full_groups) {
    if (num == 0) return DIGIT_WORDS[0];

    auto groups = splitNumberGroups(num);

    std::string result;
    for (size_t i = groups.size(); i-- > 0;) {
        const NumberGroup& group = groups[i];

        // Zero groups are skipped entirely, including the lowest one
        if (group.value == 0) continue;

        std::string group_text;
        bool leading = (i == groups.size() - 1);
        if (full_groups && !leading && group.value < 100) {
            group_text = "không trăm ";
            group_text += (group.value < 10)
                ? std::string("lẻ ") + DIGIT_WORDS[group.value]
                : smallNumberToVietnamese(group.value);
        } else {
            group_text = smallNumberToVietnamese(group.value);
        }

        if (group.position > 0 && group.position < scaleUnitCount()) {
            group_text += " ";
            group_text += SCALE_UNITS[group.position];
        }

        if (!result.empty()) result += " ";
        result += group_text;
    }
    return result;
}

std::string digitsToVietnamese(const std::string& digits) {
    std::string result;
    for (char c : digits) {
        if (c < '0' || c > '9') continue;
        if (!result.empty()) result += " ";
        result += DIGIT_WORDS[c - '0'];
    }
    return result;
}

std::string numberToVietnamese(const std::string& number_str, const NumberReadingOptions& options) {
    if (!number_str.empty() && !isAsciiDigits(number_str)) {
        std::cerr << "Warning: not a number, left unchanged: '" << number_str << "'" << std::endl;
        return number_str;
    }

    std::string digits = stripLeadingZeros(number_str);
    if (digits.empty()) {
        return DIGIT_WORDS[0];
    }

    if (digits.length() > options.max_grouped_digits) {
        return digitsToVietnamese(digits);
    }

    uint64_t num = 0;
    try {
        num = std::stoull(digits);
    } catch (const std::out_of_range&) {
        std::cerr << "Warning: number out of range, reading digit by digit: " << digits << std::endl;
        return digitsToVietnamese(digits);
    }

    if (num < 1000) {
        return smallNumberToVietnamese(static_cast<int>(num));
    }
    return groupedNumberToVietnamese(num, options.full_groups);
}

std::string decimalToVietnamese(const std::string& integer_part,
                                const std::string& decimal_part,
                                const NumberReadingOptions& options) {
    std::string result = numberToVietnamese(integer_part, options);
    result += " phẩy";

    // Decimal digits are read one by one ("05" -> "không năm")
    std::string fraction = digitsToVietnamese(decimal_part);
    if (!fraction.empty()) {
        result += " " + fraction;
    }
    return result;
}

}  // namespace text
}  // namespace vntn
