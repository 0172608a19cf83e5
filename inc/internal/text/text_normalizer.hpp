#ifndef VNTN_TEXT_NORMALIZER_HPP
#define VNTN_TEXT_NORMALIZER_HPP

/**
 * TextNormalizer - 文本规范化模块
 *
 * 将日期时间、日期、小数和整数转换为越南语读法，作为语音合成前端的输入。
 * 识别按固定顺序逐遍进行，每一遍在上一遍的输出上做全局替换：
 *
 *   日期时间 -> 日期(/) -> 日期(-) -> 日期(年在前) -> 小数(,) -> 小数(.) -> 整数
 *
 * 后面的模式是前面模式组成部分的子集 (日期中的年份本身也是整数)，
 * 调换顺序会把日期、小数拆成分别转换的碎片。
 */

#include <cstddef>

#include <regex>
#include <string>
#include <utility>
#include <vector>

#include "internal/text/number_utils.hpp"
#include "internal/vntn_config.hpp"
#include "internal/vntn_types.hpp"

namespace vntn {
namespace text {

// =============================================================================
// PatternType (识别类型)
// =============================================================================

enum class PatternType {
    DATETIME,           // YYYY-MM-DD HH:MM:SS
    DATE_SLASH,         // DD/MM/YYYY
    DATE_DASH,          // DD-MM-YYYY
    DATE_YEAR_FIRST,    // YYYY-MM-DD
    DECIMAL_COMMA,      // 3,14
    DECIMAL_DOT,        // 3.14
    INTEGER             // 1-100 位整数
};

inline const char* patternTypeToString(PatternType type) {
    switch (type) {
        case PatternType::DATETIME:        return "datetime";
        case PatternType::DATE_SLASH:      return "date_slash";
        case PatternType::DATE_DASH:       return "date_dash";
        case PatternType::DATE_YEAR_FIRST: return "date_year_first";
        case PatternType::DECIMAL_COMMA:   return "decimal_comma";
        case PatternType::DECIMAL_DOT:     return "decimal_dot";
        case PatternType::INTEGER:         return "integer";
        default:                           return "unknown";
    }
}

// =============================================================================
// NormalizerMatch (匹配结果)
// =============================================================================

struct NormalizerMatch {
    PatternType type;       // 识别类型
    size_t start;           // 起始位置 (相对于该遍扫描的文本)
    size_t length;          // 长度
    std::string original;   // 原始文本
    std::string normalized;  // 规范化后文本
};

// =============================================================================
// TextNormalizer (文本规范化器)
// =============================================================================

class TextNormalizer {
public:
    TextNormalizer();

    /**
     * @brief 使用指定配置构造
     * @param config 配置，无效时记录错误并使用默认配置
     */
    explicit TextNormalizer(const NormalizerConfig& config);

    ~TextNormalizer();

    /**
     * @brief 规范化文本
     * @param text 输入文本
     * @param matches [out] 可选，记录每个被替换的片段
     * @return 规范化后的文本
     *
     * 线程安全：不修改任何成员状态。
     */
    std::string normalize(const std::string& text,
                          std::vector<NormalizerMatch>* matches = nullptr) const;

    /**
     * @brief 获取生效的配置
     */
    const NormalizerConfig& getConfig() const { return config_; }

    /**
     * @brief 获取构造时的配置校验结果
     */
    const ErrorInfo& getConfigError() const { return config_error_; }

private:
    // 一遍识别找到的候选片段
    struct PassCandidate {
        size_t position;
        size_t length;
        std::vector<std::string> groups;  // groups[0] 为整个片段
    };

    NormalizerConfig config_;
    ErrorInfo config_error_;
    NumberReadingOptions reading_;

    // 按顺序执行的识别遍；小数遍没有正则，由线性扫描识别
    std::vector<std::pair<PatternType, std::regex>> passes_;

    void buildPasses();

    std::vector<PassCandidate> findCandidates(const std::string& text,
                                              PatternType type,
                                              const std::regex& pattern) const;

    std::string applyPass(const std::string& text,
                          PatternType type,
                          const std::regex& pattern,
                          std::vector<NormalizerMatch>* matches) const;

    std::string convertMatch(PatternType type, const std::vector<std::string>& groups) const;
};

// =============================================================================
// 便捷函数
// =============================================================================

/**
 * @brief 规范化文本 (便捷函数，默认配置)
 * @param text 输入文本
 * @return 规范化后的文本
 */
std::string normalizeText(const std::string& text);

}  // namespace text
}  // namespace vntn

#endif  // VNTN_TEXT_NORMALIZER_HPP
