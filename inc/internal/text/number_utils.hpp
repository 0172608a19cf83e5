#ifndef VNTN_NUMBER_UTILS_HPP
#define VNTN_NUMBER_UTILS_HPP

/**
 * NumberUtils - 数字处理工具模块
 *
 * 提供越南语数字读法：词表、三位数读法、分组读法、逐位读法和小数读法。
 */

#include <cstddef>
#include <cstdint>

#include <string>
#include <vector>

namespace vntn {
namespace text {

// =============================================================================
// 词表
// =============================================================================

/**
 * @brief 获取数字词 (0-9)
 * @param digit 数字
 * @return 越南语读法，如 4 -> "bốn"；超出范围返回空字符串
 */
const char* digitWord(int digit);

/**
 * @brief 获取个位数字的读法
 * @param digit 数字 (0-9)
 * @param in_tens_position 是否位于 "mười"/"mươi" 之后的个位
 * @return 在十位之后时 1 -> "mốt", 4 -> "tư", 5 -> "lăm"，其余同 digitWord
 */
const char* onesDigitWord(int digit, bool in_tens_position);

/**
 * @brief 获取分组单位
 * @param position 分组位置 (0 = 无单位, 1 = "nghìn", 2 = "triệu", 3 = "tỷ", ...)
 * @return 单位词，超出词表返回空字符串
 */
const char* scaleUnitWord(size_t position);

/**
 * @brief 分组单位词表的长度
 */
size_t scaleUnitCount();

/**
 * @brief 获取月份读法
 * @param month 月份字符串 ("1".."12" 或 "01".."09")
 * @return 读法 (4 月为 "tư")，不在词表中返回 nullptr
 */
const char* monthWord(const std::string& month);

// =============================================================================
// 数字字符串工具
// =============================================================================

/**
 * @brief 判断字符串是否全部为 ASCII 数字 (空串返回 false)
 */
bool isAsciiDigits(const std::string& str);

/**
 * @brief 去除前导零，全零时返回空字符串
 */
std::string stripLeadingZeros(const std::string& str);

// =============================================================================
// 数字读法
// =============================================================================

struct NumberGroup {
    int value;          // 0-999
    size_t position;    // 从低位开始的组序号
};

struct NumberReadingOptions {
    size_t max_grouped_digits = 18;  // 超过则逐位读
    bool full_groups = false;        // 非首组补读 "không trăm"
};

/**
 * @brief 三位数以内的读法
 * @param num 0-999 的整数
 * @return 越南语读法，如 105 -> "một trăm lẻ năm", 21 -> "hai mươi mốt"
 *
 * 超出 0-999 时返回数字原文。
 */
std::string smallNumberToVietnamese(int num);

/**
 * @brief 将整数按千分组 (低位在前)
 * @param num 要分组的整数
 * @return 分组列表，0 返回单个零组
 */
std::vector<NumberGroup> splitNumberGroups(uint64_t num);

/**
 * @brief 分组读法 (用于 >= 1000 的整数)
 * @param num 要转换的整数
 * @param full_groups 非首组不足百位时补读 "không trăm"
 * @return 越南语读法，全零组整体跳过，如 1000000 -> "một triệu"
 */
std::string groupedNumberToVietnamese(uint64_t num, bool full_groups = false);

/**
 * @brief 逐位读法
 * @param digits 数字串 (非数字字符被忽略)
 * @return 如 "305" -> "ba không năm"
 */
std::string digitsToVietnamese(const std::string& digits);

/**
 * @brief 整数字符串转越南语读法 (主入口)
 * @param number_str 数字串，允许前导零
 * @param options 读法选项
 * @return 越南语读法
 *
 * - 去除前导零后为空时读作 "không"
 * - 超过 max_grouped_digits 位时逐位读
 * - 含非数字字符时原样返回
 */
std::string numberToVietnamese(const std::string& number_str,
                               const NumberReadingOptions& options = NumberReadingOptions());

/**
 * @brief 小数读法
 * @param integer_part 整数部分
 * @param decimal_part 小数部分 (逐位读)
 * @param options 整数部分的读法选项
 * @return 如 ("3", "14") -> "ba phẩy một bốn"
 */
std::string decimalToVietnamese(const std::string& integer_part,
                                const std::string& decimal_part,
                                const NumberReadingOptions& options = NumberReadingOptions());

}  // namespace text
}  // namespace vntn

#endif  // VNTN_NUMBER_UTILS_HPP
