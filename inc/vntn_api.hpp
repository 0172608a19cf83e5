#ifndef VNTN_API_HPP
#define VNTN_API_HPP

/**
 * VntnSDK - 越南语文本规范化 SDK
 *
 * 语音合成前端的文本规范化层，将数字、小数、日期和日期时间转换为越南语读法。
 *
 * 使用示例 1 - 便捷函数:
 *
 *   std::string text = Vntn::Normalize("Ngày 15/03/2023 giá 3,14 triệu");
 *   // "Ngày ngày mười lăm tháng ba năm hai nghìn hai mươi ba giá ba phẩy một bốn triệu"
 *
 * 使用示例 2 - 带配置的规范化器:
 *
 *   Vntn::NormalizerOptions options = Vntn::NormalizerOptions::FullGroups();
 *   Vntn::Normalizer normalizer(options);
 *   auto text = normalizer.Normalize("Năm 2023");
 *   // "Năm hai nghìn không trăm hai mươi ba"
 *
 * 使用示例 3 - 查看匹配过程:
 *
 *   std::vector<Vntn::MatchInfo> trace;
 *   normalizer.NormalizeWithTrace("2023-01-05 10:30:00", trace);
 *   for (const auto& m : trace) {
 *       std::cout << m.type << ": " << m.original << " -> " << m.normalized << "\n";
 *   }
 */

#include <cstddef>

#include <memory>
#include <string>
#include <vector>

namespace Vntn {

// =============================================================================
// NormalizerOptions - 规范化配置
// =============================================================================

struct NormalizerOptions {
    bool separate_alphanumeric = true;  ///< 字母/数字边界插入空格
    bool split_separators = true;       ///< 连字符、下划线替换为空格
    int max_grouped_digits = 18;        ///< 超过该位数时逐位读 [1, 18]
    int max_integer_digits = 100;       ///< 整数识别的最大位数 [1, 100]
    bool read_full_groups = false;      ///< 非首组补读 "không trăm"
    bool verbose = false;               ///< 输出每个匹配的替换结果

    /// @brief 创建默认配置
    static NormalizerOptions Default() {
        return NormalizerOptions();
    }

    /// @brief 创建完整分组读法配置
    static NormalizerOptions FullGroups() {
        NormalizerOptions options;
        options.read_full_groups = true;
        return options;
    }

    NormalizerOptions withFullGroups(bool enable) const {
        auto o = *this;
        o.read_full_groups = enable;
        return o;
    }

    NormalizerOptions withVerbose(bool enable) const {
        auto o = *this;
        o.verbose = enable;
        return o;
    }
};

// =============================================================================
// MatchInfo - 匹配信息
// =============================================================================

struct MatchInfo {
    std::string type;           ///< 识别类型 ("datetime", "date_slash", "integer", ...)
    size_t start = 0;           ///< 起始位置 (相对于该遍扫描的文本)
    size_t length = 0;          ///< 长度
    std::string original;       ///< 原始文本
    std::string normalized;     ///< 规范化后文本
};

// =============================================================================
// Normalizer - 文本规范化器
// =============================================================================

class Normalizer {
public:
    /// @brief 构造规范化器（使用默认配置）
    Normalizer();

    /// @brief 构造规范化器（使用配置结构体）
    /// @param options 配置对象，无效时使用默认配置并记录错误
    explicit Normalizer(const NormalizerOptions& options);

    /// @brief 析构函数
    ~Normalizer();

    // 禁止拷贝
    Normalizer(const Normalizer&) = delete;
    Normalizer& operator=(const Normalizer&) = delete;

    // 移动后的源对象: Normalize 原样返回输入，IsValid 为 false
    Normalizer(Normalizer&&) noexcept;
    Normalizer& operator=(Normalizer&&) noexcept;

    /// @brief 规范化文本
    /// @param text 输入文本
    /// @return 规范化后的文本，空输入返回空字符串
    std::string Normalize(const std::string& text) const;

    /// @brief 规范化文本并返回匹配过程
    /// @param text 输入文本
    /// @param trace [out] 每个被替换片段的信息 (追加)
    /// @return 规范化后的文本
    std::string NormalizeWithTrace(const std::string& text, std::vector<MatchInfo>& trace) const;

    /// @brief 获取生效的配置
    NormalizerOptions GetOptions() const;

    /// @brief 构造时的配置是否有效
    bool IsValid() const;

    /// @brief 获取配置错误信息 (有效时为空)
    std::string GetLastError() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// 便捷函数
// =============================================================================

/// @brief 使用默认配置规范化文本
std::string Normalize(const std::string& text);

}  // namespace Vntn

#endif  // VNTN_API_HPP
