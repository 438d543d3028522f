#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "quizdb/game_date.hpp"
#include "quizdb/points.hpp"
#include "quizdb/validation_error.hpp"

TEST(PointsTest, ParsesDecimalText) {
  EXPECT_EQ(quizdb::Points::Parse("42.50").cents(), 4250);
  EXPECT_EQ(quizdb::Points::Parse("42.5").cents(), 4250);
  EXPECT_EQ(quizdb::Points::Parse("7").cents(), 700);
  EXPECT_EQ(quizdb::Points::Parse("-3.25").cents(), -325);
  EXPECT_EQ(quizdb::Points::Parse(".75").cents(), 75);
}

TEST(PointsTest, RejectsMalformedText) {
  EXPECT_THROW(quizdb::Points::Parse(""), quizdb::ValidationError);
  EXPECT_THROW(quizdb::Points::Parse("1.005"), quizdb::ValidationError);
  EXPECT_THROW(quizdb::Points::Parse("12a"), quizdb::ValidationError);
  EXPECT_THROW(quizdb::Points::Parse("-"), quizdb::ValidationError);
  EXPECT_THROW(quizdb::Points::Parse("100000000.00"), quizdb::ValidationError);
}

TEST(PointsTest, FormatsWithTwoDecimals) {
  EXPECT_EQ(quizdb::Points::FromCents(4250).ToString(), "42.50");
  EXPECT_EQ(quizdb::Points::FromCents(-5).ToString(), "-0.05");
  EXPECT_EQ(quizdb::Points::FromCents(0).ToString(), "0.00");
}

TEST(PointsTest, JsonNumbersRoundToHundredths) {
  EXPECT_EQ(quizdb::Points::FromJson(nlohmann::json(37)).cents(), 3700);
  EXPECT_EQ(quizdb::Points::FromJson(nlohmann::json(0.1 + 0.2)).cents(), 30);
  EXPECT_EQ(quizdb::Points::FromJson(nlohmann::json("12.34")).cents(), 1234);
  EXPECT_THROW(quizdb::Points::FromJson(nlohmann::json(true)), quizdb::ValidationError);
}

TEST(PointsTest, EqualityIsExact) {
  EXPECT_EQ(quizdb::Points::Parse("42.50"), quizdb::Points::FromCents(4250));
  EXPECT_NE(quizdb::Points::Parse("42.50"), quizdb::Points::Parse("42.51"));
  EXPECT_EQ(quizdb::Points::Parse("1.10") + quizdb::Points::Parse("2.20"), quizdb::Points::Parse("3.30"));
}

TEST(GameDateTest, ParsesAndFormatsIsoDates) {
  auto date = quizdb::GameDate::Parse("2024-01-15");
  EXPECT_EQ(date.year, 2024);
  EXPECT_EQ(date.month, 1);
  EXPECT_EQ(date.day, 15);
  EXPECT_EQ(date.ToString(), "2024-01-15");
  EXPECT_EQ(quizdb::GameDate::Parse("2024-02-29").ToString(), "2024-02-29");
}

TEST(GameDateTest, RejectsImpossibleDates) {
  EXPECT_THROW(quizdb::GameDate::Parse("2023-02-29"), quizdb::ValidationError);
  EXPECT_THROW(quizdb::GameDate::Parse("2024-13-01"), quizdb::ValidationError);
  EXPECT_THROW(quizdb::GameDate::Parse("2024-04-31"), quizdb::ValidationError);
  EXPECT_THROW(quizdb::GameDate::Parse("15.01.2024"), quizdb::ValidationError);
}

TEST(GameDateTest, OrdersChronologically) {
  EXPECT_TRUE(quizdb::GameDate::Parse("2023-12-31") < quizdb::GameDate::Parse("2024-01-01"));
  EXPECT_TRUE(quizdb::GameDate::Parse("2024-01-15") <= quizdb::GameDate::Parse("2024-01-15"));
  EXPECT_FALSE(quizdb::GameDate::Parse("2024-02-01") < quizdb::GameDate::Parse("2024-01-31"));
}

TEST(PointsTest, UnboundedParseReadsSumsAboveColumnRange) {
  EXPECT_EQ(quizdb::Points::ParseUnbounded("120000000.00").cents(), 12'000'000'000);
  EXPECT_EQ(quizdb::Points::ParseUnbounded("-699999999.93").cents(), -69'999'999'993);
  EXPECT_THROW(quizdb::Points::Parse("120000000.00"), quizdb::ValidationError);
  EXPECT_THROW(quizdb::Points::ParseUnbounded("1.234"), quizdb::ValidationError);
}

TEST(PointsTest, JsonIntegersOutsideColumnRangeAreRejected) {
  EXPECT_THROW(quizdb::Points::FromJson(nlohmann::json::parse("18446744073709551615")), quizdb::ValidationError);
  EXPECT_THROW(quizdb::Points::FromJson(nlohmann::json::parse("9223372036854775808")), quizdb::ValidationError);
  EXPECT_THROW(quizdb::Points::FromJson(nlohmann::json::parse("-9223372036854775808")), quizdb::ValidationError);
  EXPECT_THROW(quizdb::Points::FromJson(nlohmann::json::parse("100000000")), quizdb::ValidationError);
  EXPECT_EQ(quizdb::Points::FromJson(nlohmann::json::parse("99999999")).cents(), 9'999'999'900);
  EXPECT_EQ(quizdb::Points::FromJson(nlohmann::json::parse("-99999999")).cents(), -9'999'999'900);
}
