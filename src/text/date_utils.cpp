#include "internal/text/date_utils.hpp"

#include <string>

#include "internal/text/number_utils.hpp"

namespace vntn {
namespace text {

// =============================================================================
// Components
// =============================================================================

std::string trimDateField(const std::string& field) {
    std::string trimmed = stripLeadingZeros(field);
    return trimmed.empty() ? "0" : trimmed;
}

DateComponents makeDateComponents(const std::string& first,
                                  const std::string& second,
                                  const std::string& third,
                                  DateOrder order) {
    DateComponents date;
    if (order == DateOrder::DAY_FIRST) {
        date.day = trimDateField(first);
        date.year = third;
    } else {
        date.day = trimDateField(third);
        date.year = first;
    }
    date.month = trimDateField(second);
    return date;
}

DatetimeComponents makeDatetimeComponents(const std::string& year,
                                          const std::string& month,
                                          const std::string& day,
                                          const std::string& hour,
                                          const std::string& minute,
                                          const std::string& second) {
    DatetimeComponents datetime;
    datetime.date = makeDateComponents(year, month, day, DateOrder::YEAR_FIRST);
    datetime.hour = trimDateField(hour);
    datetime.minute = trimDateField(minute);
    datetime.second = trimDateField(second);
    return datetime;
}

// =============================================================================
// Reading
// =============================================================================

std::string dateToVietnamese(const DateComponents& date, const NumberReadingOptions& options) {
    std::string day_text = numberToVietnamese(trimDateField(date.day), options);

    std::string month = trimDateField(date.month);
    const char* month_name = monthWord(month);
    std::string month_text = month_name ? std::string(month_name)
                                        : numberToVietnamese(month, options);

    std::string year_text = numberToVietnamese(date.year, options);

    return "ngày " + day_text + " tháng " + month_text + " năm " + year_text;
}

std::string dateToVietnamese(const std::string& day,
                             const std::string& month,
                             const std::string& year,
                             const NumberReadingOptions& options) {
    return dateToVietnamese(makeDateComponents(day, month, year, DateOrder::DAY_FIRST), options);
}

std::string datetimeToVietnamese(const DatetimeComponents& datetime,
                                 const NumberReadingOptions& options) {
    std::string result = dateToVietnamese(datetime.date, options);
    result += " giờ " + numberToVietnamese(trimDateField(datetime.hour), options);
    result += " phút " + numberToVietnamese(trimDateField(datetime.minute), options);
    result += " giây " + numberToVietnamese(trimDateField(datetime.second), options);
    return result;
}

std::string datetimeToVietnamese(const std::string& year,
                                 const std::string& month,
                                 const std::string& day,
                                 const std::string& hour,
                                 const std::string& minute,
                                 const std::string& second,
                                 const NumberReadingOptions& options) {
    return datetimeToVietnamese(
        makeDatetimeComponents(year, month, day, hour, minute, second), options);
}

}  // namespace text
}  // namespace vntn
