/**
 * @file test_date_parse.cc
 * @brief Unit tests for YYYYMMDD extraction and the date parser chain
 */

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "picsort/date_parse.hh"

using namespace std::chrono;

namespace {

picsort::date_t ymd(int y, unsigned m, unsigned d) {
  return picsort::date_t{year(y), month(m), day(d)};
}

}  // namespace

TEST(ParseYyyymmdd, PlainDateName) {
  auto date = picsort::parse_yyyymmdd("20230415.jpg");
  ASSERT_TRUE(date.has_value());
  EXPECT_EQ(*date, ymd(2023, 4, 15));
}

TEST(ParseYyyymmdd, DateInsideName) {
  auto date = picsort::parse_yyyymmdd("IMG_20191231_wedding.png");
  ASSERT_TRUE(date.has_value());
  EXPECT_EQ(*date, ymd(2019, 12, 31));
}

TEST(ParseYyyymmdd, ShortDigitRunsAreIgnored) {
  auto date = picsort::parse_yyyymmdd("IMG_20210704_123456.jpg");
  ASSERT_TRUE(date.has_value());
  EXPECT_EQ(*date, ymd(2021, 7, 4));
}

TEST(ParseYyyymmdd, NineDigitsAreAmbiguous) {
  // two overlapping windows: 20230415 and 02304155
  EXPECT_FALSE(picsort::parse_yyyymmdd("IMG_202304155.jpg").has_value());
}

TEST(ParseYyyymmdd, LongDigitRunIsAmbiguous) {
  EXPECT_FALSE(picsort::parse_yyyymmdd("2023041520230415.jpg").has_value());
}

TEST(ParseYyyymmdd, TwoSeparateDatesAreAmbiguous) {
  EXPECT_FALSE(picsort::parse_yyyymmdd("20230101-20230102.jpg").has_value());
  // even when both windows are the same date
  EXPECT_FALSE(picsort::parse_yyyymmdd("20230101_20230101.jpg").has_value());
}

TEST(ParseYyyymmdd, InvalidMonthOrDay) {
  EXPECT_FALSE(picsort::parse_yyyymmdd("20231332.jpg").has_value());
  EXPECT_FALSE(picsort::parse_yyyymmdd("20230431.jpg").has_value());
  EXPECT_FALSE(picsort::parse_yyyymmdd("20230015.jpg").has_value());
  EXPECT_FALSE(picsort::parse_yyyymmdd("20230100.jpg").has_value());
}

TEST(ParseYyyymmdd, LeapYears) {
  EXPECT_EQ(picsort::parse_yyyymmdd("20240229.jpg"), ymd(2024, 2, 29));
  EXPECT_EQ(picsort::parse_yyyymmdd("20000229.jpg"), ymd(2000, 2, 29));
  EXPECT_FALSE(picsort::parse_yyyymmdd("20230229.jpg").has_value());
  EXPECT_FALSE(picsort::parse_yyyymmdd("19000229.jpg").has_value());
}

TEST(ParseYyyymmdd, YearZeroIsRejected) {
  EXPECT_FALSE(picsort::parse_yyyymmdd("00000101.jpg").has_value());
  EXPECT_EQ(picsort::parse_yyyymmdd("00010101.jpg"), ymd(1, 1, 1));
}

TEST(ParseYyyymmdd, NoDigits) {
  EXPECT_FALSE(picsort::parse_yyyymmdd("vacation.jpg").has_value());
  EXPECT_FALSE(picsort::parse_yyyymmdd("").has_value());
  EXPECT_FALSE(picsort::parse_yyyymmdd("2023041.jpg").has_value());
}

TEST(ParseYyyymmdd, OnlyAsciiDigitsCount) {
  // full-width digits U+FF10..U+FF19
  EXPECT_FALSE(picsort::parse_yyyymmdd("２０２３０４１５.jpg").has_value());
  EXPECT_EQ(picsort::parse_yyyymmdd("IMG_２０２３_20230415.jpg"),
            ymd(2023, 4, 15));
}

TEST(DateParser, DefaultChainFindsYyyymmdd) {
  EXPECT_EQ(picsort::date_parser_t::defaults().size(), 1U);
  EXPECT_EQ(picsort::parse_date("20230415.jpg"), ymd(2023, 4, 15));
  EXPECT_FALSE(picsort::parse_date("IMG_202304155.jpg").has_value());
}

TEST(DateParser, EmptyChainFindsNothing) {
  picsort::date_parser_t parser;
  EXPECT_FALSE(parser("20230415.jpg").has_value());
}

TEST(DateParser, FirstSuccessfulStrategyWins) {
  int second_calls = 0;
  picsort::date_parser_t parser;
  parser.add("yyyymmdd", picsort::parse_yyyymmdd)
      .add("fixed", [&](std::string_view) -> std::optional<picsort::date_t> {
        ++second_calls;
        return ymd(1999, 1, 1);
      });

  EXPECT_EQ(parser("20230415.jpg"), ymd(2023, 4, 15));
  EXPECT_EQ(second_calls, 0);

  // falls through to the next strategy when the first finds nothing
  EXPECT_EQ(parser("vacation.jpg"), ymd(1999, 1, 1));
  EXPECT_EQ(second_calls, 1);
}
