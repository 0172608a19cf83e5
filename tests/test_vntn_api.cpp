#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

#include "vntn_api.hpp"

TEST(VntnApiTest, ConvenienceFunction) {
    EXPECT_EQ(Vntn::Normalize("Ngày 15/03/2023 giá 3,14 triệu"),
              "Ngày ngày mười lăm tháng ba năm hai nghìn hai mươi ba "
              "giá ba phẩy một bốn triệu");
    EXPECT_EQ(Vntn::Normalize(""), "");
}

TEST(VntnApiTest, DefaultNormalizer) {
    Vntn::Normalizer normalizer;
    EXPECT_TRUE(normalizer.IsValid());
    EXPECT_EQ(normalizer.GetLastError(), "");
    EXPECT_EQ(normalizer.Normalize("Năm 2023"), "Năm hai nghìn hai mươi ba");

    auto options = normalizer.GetOptions();
    EXPECT_EQ(options.max_grouped_digits, 18);
    EXPECT_EQ(options.max_integer_digits, 100);
    EXPECT_FALSE(options.read_full_groups);
}

TEST(VntnApiTest, FullGroupOptions) {
    Vntn::Normalizer normalizer(Vntn::NormalizerOptions::FullGroups());
    EXPECT_EQ(normalizer.Normalize("Năm 2023"), "Năm hai nghìn không trăm hai mươi ba");
    EXPECT_TRUE(normalizer.GetOptions().read_full_groups);
}

TEST(VntnApiTest, TraceReportsEachReplacement) {
    Vntn::Normalizer normalizer;
    std::vector<Vntn::MatchInfo> trace;
    std::string result = normalizer.NormalizeWithTrace("2023-01-05 10:30:00 và 42", trace);

    EXPECT_EQ(result,
              "ngày năm tháng một năm hai nghìn hai mươi ba "
              "giờ mười phút ba mươi giây không và bốn mươi hai");
    ASSERT_EQ(trace.size(), 2u);
    EXPECT_EQ(trace[0].type, "datetime");
    EXPECT_EQ(trace[0].original, "2023-01-05 10:30:00");
    EXPECT_EQ(trace[1].type, "integer");
    EXPECT_EQ(trace[1].original, "42");
    EXPECT_EQ(trace[1].normalized, "bốn mươi hai");
}

TEST(VntnApiTest, InvalidOptionsAreReported) {
    Vntn::NormalizerOptions options;
    options.max_grouped_digits = -1;
    Vntn::Normalizer normalizer(options);

    EXPECT_FALSE(normalizer.IsValid());
    EXPECT_EQ(normalizer.GetLastError().rfind("INVALID_CONFIG", 0), 0u);
    EXPECT_EQ(normalizer.GetOptions().max_grouped_digits, 18);
    EXPECT_EQ(normalizer.Normalize("1005"), "một nghìn năm");
}

TEST(VntnApiTest, MoveKeepsConfiguration) {
    Vntn::Normalizer original(Vntn::NormalizerOptions::FullGroups());
    Vntn::Normalizer moved(std::move(original));
    EXPECT_EQ(moved.Normalize("1005"), "một nghìn không trăm lẻ năm");
}

TEST(VntnApiTest, MovedFromNormalizerPassesTextThrough) {
    Vntn::Normalizer original;
    Vntn::Normalizer moved(std::move(original));

    EXPECT_FALSE(original.IsValid());
    EXPECT_EQ(original.GetLastError(), "Normalizer has been moved from");
    EXPECT_EQ(original.Normalize("Năm 2023"), "Năm 2023");
    EXPECT_EQ(original.GetOptions().max_grouped_digits, 18);

    std::vector<Vntn::MatchInfo> trace;
    EXPECT_EQ(original.NormalizeWithTrace("42", trace), "42");
    EXPECT_TRUE(trace.empty());

    // Assigning a live normalizer makes it usable again
    original = std::move(moved);
    EXPECT_TRUE(original.IsValid());
    EXPECT_EQ(original.Normalize("42"), "bốn mươi hai");
}
