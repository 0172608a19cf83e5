#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "internal/text/number_utils.hpp"

using namespace vntn::text;

// =============================================================================
// Lexical tables
// =============================================================================

TEST(DigitWordTest, CoversAllDigits) {
    const std::vector<std::string> expected = {
        "không", "một", "hai", "ba", "bốn", "năm", "sáu", "bảy", "tám", "chín"
    };
    for (int d = 0; d <= 9; ++d) {
        EXPECT_EQ(digitWord(d), expected[d]) << "digit " << d;
    }
    EXPECT_STREQ(digitWord(10), "");
    EXPECT_STREQ(digitWord(-1), "");
}

TEST(DigitWordTest, TensPositionOverrides) {
    EXPECT_STREQ(onesDigitWord(1, true), "mốt");
    EXPECT_STREQ(onesDigitWord(4, true), "tư");
    EXPECT_STREQ(onesDigitWord(5, true), "lăm");
    EXPECT_STREQ(onesDigitWord(2, true), "hai");
    EXPECT_STREQ(onesDigitWord(9, true), "chín");

    EXPECT_STREQ(onesDigitWord(1, false), "một");
    EXPECT_STREQ(onesDigitWord(4, false), "bốn");
    EXPECT_STREQ(onesDigitWord(5, false), "năm");
}

TEST(ScaleUnitTest, UnitsByPosition) {
    EXPECT_STREQ(scaleUnitWord(0), "");
    EXPECT_STREQ(scaleUnitWord(1), "nghìn");
    EXPECT_STREQ(scaleUnitWord(2), "triệu");
    EXPECT_STREQ(scaleUnitWord(3), "tỷ");
    EXPECT_STREQ(scaleUnitWord(4), "nghìn tỷ");
    EXPECT_STREQ(scaleUnitWord(6), "tỷ tỷ");
    EXPECT_EQ(scaleUnitCount(), 7u);
    EXPECT_STREQ(scaleUnitWord(42), "");
}

TEST(MonthWordTest, PaddedAndUnpadded) {
    EXPECT_STREQ(monthWord("1"), "một");
    EXPECT_STREQ(monthWord("01"), "một");
    EXPECT_STREQ(monthWord("4"), "tư");
    EXPECT_STREQ(monthWord("04"), "tư");
    EXPECT_STREQ(monthWord("10"), "mười");
    EXPECT_STREQ(monthWord("12"), "mười hai");
    EXPECT_EQ(monthWord("13"), nullptr);
    EXPECT_EQ(monthWord("0"), nullptr);
}

// =============================================================================
// Small numbers
// =============================================================================

TEST(SmallNumberTest, SingleDigitsMatchTable) {
    for (int d = 0; d <= 9; ++d) {
        EXPECT_EQ(smallNumberToVietnamese(d), digitWord(d));
    }
}

TEST(SmallNumberTest, Teens) {
    EXPECT_EQ(smallNumberToVietnamese(10), "mười");
    EXPECT_EQ(smallNumberToVietnamese(11), "mười mốt");
    EXPECT_EQ(smallNumberToVietnamese(14), "mười tư");
    EXPECT_EQ(smallNumberToVietnamese(15), "mười lăm");
    EXPECT_EQ(smallNumberToVietnamese(19), "mười chín");
}

TEST(SmallNumberTest, Tens) {
    EXPECT_EQ(smallNumberToVietnamese(20), "hai mươi");
    EXPECT_EQ(smallNumberToVietnamese(21), "hai mươi mốt");
    EXPECT_EQ(smallNumberToVietnamese(24), "hai mươi tư");
    EXPECT_EQ(smallNumberToVietnamese(55), "năm mươi lăm");
    EXPECT_EQ(smallNumberToVietnamese(99), "chín mươi chín");
}

TEST(SmallNumberTest, Hundreds) {
    EXPECT_EQ(smallNumberToVietnamese(100), "một trăm");
    EXPECT_EQ(smallNumberToVietnamese(101), "một trăm lẻ một");
    EXPECT_EQ(smallNumberToVietnamese(104), "một trăm lẻ bốn");
    EXPECT_EQ(smallNumberToVietnamese(105), "một trăm lẻ năm");
    EXPECT_EQ(smallNumberToVietnamese(110), "một trăm mười");
    EXPECT_EQ(smallNumberToVietnamese(111), "một trăm mười mốt");
    EXPECT_EQ(smallNumberToVietnamese(115), "một trăm mười lăm");
    EXPECT_EQ(smallNumberToVietnamese(120), "một trăm hai mươi");
    EXPECT_EQ(smallNumberToVietnamese(345), "ba trăm bốn mươi lăm");
    EXPECT_EQ(smallNumberToVietnamese(999), "chín trăm chín mươi chín");
}

TEST(SmallNumberTest, OutOfRangeReturnsDigits) {
    EXPECT_EQ(smallNumberToVietnamese(1000), "1000");
    EXPECT_EQ(smallNumberToVietnamese(-3), "-3");
}

// =============================================================================
// Grouped numbers
// =============================================================================

TEST(GroupedNumberTest, SplitIsLittleEndian) {
    auto groups = splitNumberGroups(1002003);
    ASSERT_EQ(groups.size(), 3u);
    EXPECT_EQ(groups[0].value, 3);
    EXPECT_EQ(groups[0].position, 0u);
    EXPECT_EQ(groups[1].value, 2);
    EXPECT_EQ(groups[2].value, 1);
    EXPECT_EQ(groups[2].position, 2u);

    auto zero = splitNumberGroups(0);
    ASSERT_EQ(zero.size(), 1u);
    EXPECT_EQ(zero[0].value, 0);
}

TEST(GroupedNumberTest, ZeroGroupsAreSkipped) {
    EXPECT_EQ(numberToVietnamese("1000"), "một nghìn");
    EXPECT_EQ(numberToVietnamese("1000000"), "một triệu");
    EXPECT_EQ(numberToVietnamese("1005"), "một nghìn năm");
    EXPECT_EQ(numberToVietnamese("1000005"), "một triệu năm");
    EXPECT_EQ(numberToVietnamese("1000000000"), "một tỷ");
    EXPECT_EQ(numberToVietnamese("2000000000000"), "hai nghìn tỷ");
}

TEST(GroupedNumberTest, InnerGroupsKeepIrregularForms) {
    EXPECT_EQ(numberToVietnamese("2023"), "hai nghìn hai mươi ba");
    EXPECT_EQ(numberToVietnamese("1105"), "một nghìn một trăm lẻ năm");
    EXPECT_EQ(numberToVietnamese("21021"), "hai mươi mốt nghìn hai mươi mốt");
    EXPECT_EQ(numberToVietnamese("123456789"),
              "một trăm hai mươi ba triệu bốn trăm năm mươi sáu nghìn "
              "bảy trăm tám mươi chín");
}

TEST(GroupedNumberTest, FullGroupReading) {
    EXPECT_EQ(groupedNumberToVietnamese(2023, true), "hai nghìn không trăm hai mươi ba");
    EXPECT_EQ(groupedNumberToVietnamese(1005, true), "một nghìn không trăm lẻ năm");
    EXPECT_EQ(groupedNumberToVietnamese(1015, true), "một nghìn không trăm mười lăm");
    EXPECT_EQ(groupedNumberToVietnamese(1100, true), "một nghìn một trăm");
    EXPECT_EQ(groupedNumberToVietnamese(1000, true), "một nghìn");
    EXPECT_EQ(groupedNumberToVietnamese(5000003, true), "năm triệu không trăm lẻ ba");
}

TEST(GroupedNumberTest, EighteenDigitLimit) {
    EXPECT_EQ(numberToVietnamese("999999999999999999"),
              "chín trăm chín mươi chín triệu tỷ "
              "chín trăm chín mươi chín nghìn tỷ "
              "chín trăm chín mươi chín tỷ "
              "chín trăm chín mươi chín triệu "
              "chín trăm chín mươi chín nghìn "
              "chín trăm chín mươi chín");
    EXPECT_EQ(numberToVietnamese("1234567890123456789"),
              "một hai ba bốn năm sáu bảy tám chín không "
              "một hai ba bốn năm sáu bảy tám chín");
}

// =============================================================================
// Number entry point
// =============================================================================

TEST(NumberToVietnameseTest, LeadingZeros) {
    EXPECT_EQ(numberToVietnamese("0"), "không");
    EXPECT_EQ(numberToVietnamese("000"), "không");
    EXPECT_EQ(numberToVietnamese(""), "không");
    EXPECT_EQ(numberToVietnamese("007"), "bảy");
    EXPECT_EQ(numberToVietnamese("0042"), "bốn mươi hai");
}

TEST(NumberToVietnameseTest, LongNumbersCountDigitsAfterStripping) {
    // 18 significant digits behind two zeros still use grouped reading
    EXPECT_EQ(numberToVietnamese("00100000000000000000"), "một trăm triệu tỷ");
}

TEST(NumberToVietnameseTest, MalformedInputIsReturnedUnchanged) {
    EXPECT_EQ(numberToVietnamese("12a"), "12a");
    EXPECT_EQ(numberToVietnamese("3.5"), "3.5");
}

TEST(NumberToVietnameseTest, CustomGroupingLimit) {
    NumberReadingOptions options;
    options.max_grouped_digits = 3;
    EXPECT_EQ(numberToVietnamese("999", options), "chín trăm chín mươi chín");
    EXPECT_EQ(numberToVietnamese("1234", options), "một hai ba bốn");
}

TEST(DigitsToVietnameseTest, ReadsEachDigit) {
    EXPECT_EQ(digitsToVietnamese("305"), "ba không năm");
    EXPECT_EQ(digitsToVietnamese("0"), "không");
    EXPECT_EQ(digitsToVietnamese(""), "");
}

// =============================================================================
// Decimals
// =============================================================================

TEST(DecimalTest, FractionDigitsAreReadIndividually) {
    EXPECT_EQ(decimalToVietnamese("3", "14"), "ba phẩy một bốn");
    EXPECT_EQ(decimalToVietnamese("12", "05"), "mười hai phẩy không năm");
    EXPECT_EQ(decimalToVietnamese("0", "0"), "không phẩy không");
    EXPECT_EQ(decimalToVietnamese("1000", "25"), "một nghìn phẩy hai năm");
}
