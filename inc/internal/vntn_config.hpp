#ifndef VNTN_CONFIG_HPP
#define VNTN_CONFIG_HPP

#include <cstddef>

#include <string>

#include "vntn_types.hpp"

namespace vntn {

// =============================================================================
// Normalizer Config (规范化配置 - 内部使用)
// =============================================================================

struct NormalizerConfig {
    // -------------------------------------------------------------------------
    // 预处理
    // -------------------------------------------------------------------------

    bool separate_alphanumeric = true;  ///< 字母/数字边界插入空格 (22T583 -> 22 T 583)
    bool split_separators = true;       ///< 连字符、下划线替换为空格

    // -------------------------------------------------------------------------
    // 数字读法
    // -------------------------------------------------------------------------

    size_t max_grouped_digits = 18;     ///< 超过该位数时逐位读 [1, 18]
    size_t max_integer_digits = 100;    ///< 整数识别的最大位数 [1, 100]
    bool read_full_groups = false;      ///< 非首组补读 "không trăm" (2023 -> hai nghìn không trăm hai mươi ba)

    // -------------------------------------------------------------------------
    // 日志
    // -------------------------------------------------------------------------

    bool verbose = false;               ///< 输出每个匹配的替换结果

    // -------------------------------------------------------------------------
    // 便捷构建方法
    // -------------------------------------------------------------------------

    /// @brief 创建默认配置
    static NormalizerConfig Default() {
        return NormalizerConfig();
    }

    /// @brief 创建完整分组读法配置 (年份等常用读法)
    static NormalizerConfig FullGroups() {
        NormalizerConfig config;
        config.read_full_groups = true;
        return config;
    }

    // -------------------------------------------------------------------------
    // 链式配置
    // -------------------------------------------------------------------------

    NormalizerConfig withFullGroups(bool enable) const {
        auto c = *this;
        c.read_full_groups = enable;
        return c;
    }

    NormalizerConfig withVerbose(bool enable) const {
        auto c = *this;
        c.verbose = enable;
        return c;
    }

    NormalizerConfig withMaxGroupedDigits(size_t digits) const {
        auto c = *this;
        c.max_grouped_digits = digits;
        return c;
    }

    NormalizerConfig withMaxIntegerDigits(size_t digits) const {
        auto c = *this;
        c.max_integer_digits = digits;
        return c;
    }

    // -------------------------------------------------------------------------
    // 工具方法
    // -------------------------------------------------------------------------

    /// @brief 验证配置是否有效
    /// @return 错误信息
    ErrorInfo validate() const {
        if (max_grouped_digits == 0 || max_grouped_digits > 18) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "max_grouped_digits must be 1-18",
                "got " + std::to_string(max_grouped_digits));
        }
        if (max_integer_digits == 0 || max_integer_digits > 100) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "max_integer_digits must be 1-100",
                "got " + std::to_string(max_integer_digits));
        }
        return ErrorInfo::ok();
    }
};

}  // namespace vntn

#endif  // VNTN_CONFIG_HPP
