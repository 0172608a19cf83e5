#ifndef VNTN_DATE_UTILS_HPP
#define VNTN_DATE_UTILS_HPP

/**
 * DateUtils - 日期时间读法模块
 *
 * 将日期、日期时间分量组合为越南语读法：
 *   "ngày <日> tháng <月> năm <年>"
 *   "ngày <日> tháng <月> năm <年> giờ <时> phút <分> giây <秒>"
 */

#include <string>

#include "internal/text/number_utils.hpp"

namespace vntn {
namespace text {

// =============================================================================
// DateOrder (日期分量顺序)
// =============================================================================

enum class DateOrder {
    DAY_FIRST,      // DD/MM/YYYY, DD-MM-YYYY
    YEAR_FIRST      // YYYY-MM-DD
};

// =============================================================================
// 日期分量
// =============================================================================

struct DateComponents {
    std::string day;        // 已去除前导零 ("05" -> "5", "00" -> "0")
    std::string month;      // 已去除前导零
    std::string year;
};

struct DatetimeComponents {
    DateComponents date;
    std::string hour;       // 已去除前导零
    std::string minute;
    std::string second;
};

/**
 * @brief 去除日期/时间字段的前导零，全零时返回 "0"
 */
std::string trimDateField(const std::string& field);

/**
 * @brief 按书写顺序构造日期分量
 * @param first 第一个字段
 * @param second 第二个字段 (总是月份)
 * @param third 第三个字段
 * @param order DAY_FIRST 时 first 为日、third 为年；YEAR_FIRST 时相反
 */
DateComponents makeDateComponents(const std::string& first,
                                  const std::string& second,
                                  const std::string& third,
                                  DateOrder order);

/**
 * @brief 构造日期时间分量 (日期部分总是年在前)
 */
DatetimeComponents makeDatetimeComponents(const std::string& year,
                                          const std::string& month,
                                          const std::string& day,
                                          const std::string& hour,
                                          const std::string& minute,
                                          const std::string& second);

// =============================================================================
// 读法
// =============================================================================

/**
 * @brief 日期读法
 * @return "ngày <day> tháng <month> năm <year>"
 *
 * 月份优先查月份词表 (4 月读 "tư")，不在词表中 (如 "13") 时按普通数字读。
 */
std::string dateToVietnamese(const DateComponents& date,
                             const NumberReadingOptions& options = NumberReadingOptions());

/**
 * @brief 日期读法 (便捷函数)
 * @param day 日
 * @param month 月
 * @param year 年
 */
std::string dateToVietnamese(const std::string& day,
                             const std::string& month,
                             const std::string& year,
                             const NumberReadingOptions& options = NumberReadingOptions());

/**
 * @brief 日期时间读法
 * @return 日期读法 + " giờ <hour> phút <minute> giây <second>"
 */
std::string datetimeToVietnamese(const DatetimeComponents& datetime,
                                 const NumberReadingOptions& options = NumberReadingOptions());

/**
 * @brief 日期时间读法 (便捷函数，参数按 YYYY-MM-DD HH:MM:SS 顺序)
 */
std::string datetimeToVietnamese(const std::string& year,
                                 const std::string& month,
                                 const std::string& day,
                                 const std::string& hour,
                                 const std::string& minute,
                                 const std::string& second,
                                 const NumberReadingOptions& options = NumberReadingOptions());

}  // namespace text
}  // namespace vntn

#endif  // VNTN_DATE_UTILS_HPP
