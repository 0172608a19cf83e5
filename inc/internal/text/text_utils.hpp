#ifndef VNTN_TEXT_UTILS_HPP
#define VNTN_TEXT_UTILS_HPP

/**
 * TextUtils - 文本处理工具模块
 *
 * 提供 UTF-8 字符串处理、字符类型判断、空白折叠与字母数字分隔等功能。
 */

#include <cstddef>
#include <cstdint>

#include <string>
#include <vector>

namespace vntn {
namespace text {

// =============================================================================
// UTF-8 字符串处理
// =============================================================================

/**
 * @brief 将 UTF-8 字符串分割为单个字符
 * @param str UTF-8 编码的字符串
 * @return 每个 UTF-8 字符组成的向量
 *
 * 非法或截断的字节序列按原字节保留，不会丢失内容。
 */
std::vector<std::string> splitUtf8(const std::string& str);

/**
 * @brief 解码单个 UTF-8 字符的码位
 * @param ch UTF-8 编码的单个字符
 * @return Unicode 码位，非法序列返回 0xFFFD
 */
uint32_t decodeUtf8(const std::string& ch);

// =============================================================================
// 字符类型判断
// =============================================================================

enum class CharClass {
    OTHER,      // 空白、标点、符号、组合附加符号
    LETTER,     // 字母 (含越南语带声调字母)
    DIGIT       // ASCII 数字 0-9
};

/**
 * @brief 判断码位是否为字母
 *
 * 按码位区间判断，覆盖拉丁字母 (含越南语使用的 Latin Extended Additional)、
 * 希腊、西里尔、亚美尼亚、希伯来、阿拉伯、叙利亚、印度系文字 (天城文等)、
 * 泰文、老挝文、藏文、缅文、格鲁吉亚、埃塞俄比亚、高棉文、假名、汉字和韩文。
 * 组合附加符号 (U+0300-U+036F) 与印度系元音附标不算字母。
 */
bool isLetterCodepoint(uint32_t cp);

/**
 * @brief 判断 UTF-8 字符是否为空白字符 (含 NBSP、全角空格等 Unicode 空白)
 */
bool isWhitespaceChar(const std::string& ch);

/**
 * @brief 判断是否为数字
 * @param ch UTF-8 编码的单个字符
 * @return true 如果是 0-9
 */
bool isDigit(const std::string& ch);

/**
 * @brief 获取 UTF-8 字符的类型
 */
CharClass classifyChar(const std::string& ch);

// =============================================================================
// 预处理
// =============================================================================

/**
 * @brief 折叠连续空白为单个空格，并去除首尾空白
 * @param text 输入文本
 * @return 处理后的文本
 */
std::string collapseWhitespace(const std::string& text);

/**
 * @brief 在字母串与数字串的交界处插入空格
 * @param text 输入文本
 * @return 处理后的文本，如 "22T583XYZ" -> "22 T 583 XYZ"
 *
 * 只在前一字符与当前字符均为字母/数字且类型不同时插入空格，
 * 与其他字符相邻的边界保持不变。
 */
std::string separateAlphanumeric(const std::string& text);

/**
 * @brief 将下划线和连字符替换为空格
 * @param text 输入文本
 * @param keep_digit_hyphens 为 true 时保留两侧均为数字的连字符 (日期 2023-01-05)
 * @return 处理后的文本
 */
std::string splitSeparators(const std::string& text, bool keep_digit_hyphens = true);

// =============================================================================
// 数字片段扫描
// =============================================================================
//
// 以下函数按字节线性扫描，数字串长度不受限制。

/**
 * @brief 小数候选片段
 */
struct DecimalSpan {
    size_t start;               // 起始字节位置
    size_t length;              // 字节长度
    std::string integer_part;   // 分隔符前的数字
    std::string fraction_part;  // 分隔符后的数字
};

/**
 * @brief 查找 "数字串 分隔符 数字串" 形式的小数
 * @param text 输入文本
 * @param separator 小数分隔符 (',' 或 '.')
 * @return 按出现顺序排列、互不重叠的片段
 *
 * 片段两端必须是单词边界：前一字节和后一字节都不能是 ASCII 字母、数字或下划线。
 * "1,2,3" 只识别 "1,2"，剩下的 ",3" 交给后续处理。
 */
std::vector<DecimalSpan> findDecimalSpans(const std::string& text, char separator);

/**
 * @brief 在数字与紧随其后的非数字、非空白字符之间插入空格
 * @param text 输入文本
 * @return 处理后的文本，如 "12%" -> "12 %"
 */
std::string spaceDigitsBeforeSymbols(const std::string& text);

}  // namespace text
}  // namespace vntn

#endif  // VNTN_TEXT_UTILS_HPP
