//-------------------------------------------------------------------------------------------------
// File: datename_test.cpp
// Author: Dennis Lang
//
// Desc: Date matching and normalized name tests

//-------------------------------------------------------------------------------------------------
//
// Author: Dennis Lang - 2024
// https://landenlabs.com
//
//
//
// ----- License ----
//
// Copyright (c) 2024  Dennis Lang
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell copies
// of the Software, and to permit persons to whom the Software is furnished to do
// so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS
// FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR
// COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER
// IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM, OUT OF OR IN
// CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE SOFTWARE.

#include "datename.hpp"

#include <stdexcept>
#include <time.h>

#include <gtest/gtest.h>

namespace {

time_t LocalTime(int year, int month, int day, int hour = 0, int minute = 0, int second = 0) {
    struct tm tmLocal = {};
    tmLocal.tm_year = year - 1900;
    tmLocal.tm_mon = month - 1;
    tmLocal.tm_mday = day;
    tmLocal.tm_hour = hour;
    tmLocal.tm_min = minute;
    tmLocal.tm_sec = second;
    tmLocal.tm_isdst = -1;
    return mktime(&tmLocal);
}

class DateMatcherTest : public testing::Test {
 protected:
    void SetUp() override {
        config_.validYears = validYearSet(2024, 30, 5);     // 1994 .. 2028
        config_.now = LocalTime(2024, 11, 20, 8, 30, 0);
        times_.ctime = LocalTime(2019, 7, 4, 10, 15, 42);
        times_.mtime = LocalTime(2020, 1, 1, 12, 0, 0);
    }

    lstring Normalize(const lstring& name) {
        DateMatcher matcher(config_);
        return matcher.normalize(name, times_);
    }

    DateConfig config_;
    FileTimes times_;
};

TEST(ValidYearSetTest, HalfOpenRange) {
    YearSet years = validYearSet(2024, 2, 2);
    EXPECT_EQ(4u, years.size());
    EXPECT_EQ(1u, years.count(2022));
    EXPECT_EQ(1u, years.count(2025));
    EXPECT_EQ(0u, years.count(2021));
    EXPECT_EQ(0u, years.count(2026));
}

TEST(ValidYearSetTest, HugeOffsetsClampToFourDigits) {
    YearSet years = validYearSet(2026, 4294967295u, 4294967295u);
    ASSERT_EQ(9000u, years.size());
    EXPECT_EQ(1000, *years.begin());
    EXPECT_EQ(9999, *years.rbegin());

    years = validYearSet(2026, 20000000, 5);
    ASSERT_FALSE(years.empty());
    EXPECT_EQ(1000, *years.begin());
    EXPECT_EQ(2030, *years.rbegin());
}

TEST(MonthNameTableTest, TwelveNamesAndAbbreviations) {
    const MonthTable& table = monthNameTable();
    ASSERT_EQ(12u, table.names.size());
    ASSERT_EQ(12u, table.abbreviations.size());
    EXPECT_EQ("January", table.names[0]);
    EXPECT_EQ("Dec", table.abbreviations[11]);
}

TEST_F(DateMatcherTest, YearFirstWithDay) {
    EXPECT_EQ("2020-03-15-Report", Normalize("Report-2020-03-15"));
}

TEST_F(DateMatcherTest, YearAndMonthOnly) {
    EXPECT_EQ("2020-03-notes", Normalize("notes-2020-03"));
    EXPECT_EQ("2021-11", Normalize("2021_11"));
}

TEST_F(DateMatcherTest, DayFirstGivesSameResult) {
    EXPECT_EQ(Normalize("Report-2020-03-15"), Normalize("15-03-2020-Report"));
}

TEST_F(DateMatcherTest, DayFirstNeverReadAsMonthFirst) {
    EXPECT_EQ("2020-03-05", Normalize("05-03-2020"));
}

TEST_F(DateMatcherTest, MonthNameAndYear) {
    EXPECT_EQ("2020-03-notes", Normalize("March-2020-notes"));
    EXPECT_EQ("2021-12-notes", Normalize("notes_Dec_2021"));
    EXPECT_EQ("2022-09", Normalize("SEPTEMBER 2022"));
    EXPECT_EQ("2022-09", Normalize("sep2022"));
}

TEST_F(DateMatcherTest, MonthNameInsideYearFirst) {
    EXPECT_EQ("2020-03-15-trip", Normalize("trip-2020-March-15"));
    EXPECT_EQ("2020-05-01", Normalize("1 may 2020"));
}

TEST_F(DateMatcherTest, UnderscoreSeparators) {
    EXPECT_EQ("2015-01-01-blah", Normalize("blah_2015_01_01"));
    EXPECT_EQ("2015-01-01-blah-bling", Normalize("blah_2015_01_01_bling"));
    EXPECT_EQ("2015-01-01-blah-bling", Normalize("blah-2015-01-01-bling"));
}

TEST_F(DateMatcherTest, SingleDigitsArePadded) {
    EXPECT_EQ("2020-03-07-party", Normalize("party-2020-3-7"));
    EXPECT_EQ("2020-03-07", Normalize("7.3.2020"));
}

TEST_F(DateMatcherTest, CompactDateAndTime) {
    EXPECT_EQ("2020-03-15T12-34-56-IMG", Normalize("IMG_20200315_123456"));
    EXPECT_EQ("2020-03-15T12-34", Normalize("20200315T1234"));
    EXPECT_EQ("2021-06-01T09-30 meeting", Normalize("2021-06-01 at 09.30 meeting"));
    EXPECT_EQ("2021-06-01T17-call", Normalize("2021-06-01, 17-call"));
}

TEST_F(DateMatcherTest, InvalidTimeStaysInSuffix) {
    DateMatcher matcher(config_);
    DateMatch match;
    ASSERT_TRUE(matcher.find("2021-01-05-25", match));
    EXPECT_TRUE(match.hour.empty());
    EXPECT_EQ("-25", match.suffix);
}

TEST_F(DateMatcherTest, DayOutOfRangeIsNotDay) {
    DateMatcher matcher(config_);
    DateMatch match;
    ASSERT_TRUE(matcher.find("2021-01-32", match));
    EXPECT_EQ(DateLayout::yearFirst, match.layout);
    EXPECT_EQ("01", match.month);
    EXPECT_TRUE(match.day.empty());
    EXPECT_EQ("-32", match.suffix);
}

TEST_F(DateMatcherTest, CalendarNotValidated) {
    EXPECT_EQ("2021-02-30", Normalize("2021-02-30"));
}

TEST_F(DateMatcherTest, LayoutTags) {
    DateMatcher matcher(config_);
    DateMatch match;

    ASSERT_TRUE(matcher.find("2020-03-15", match));
    EXPECT_EQ(DateLayout::yearFirst, match.layout);

    ASSERT_TRUE(matcher.find("15-03-2020", match));
    EXPECT_EQ(DateLayout::dayFirst, match.layout);
    EXPECT_EQ("15", match.day);

    ASSERT_TRUE(matcher.find("March 2020", match));
    EXPECT_EQ(DateLayout::monthNameYear, match.layout);
    EXPECT_EQ("March", match.month);
    EXPECT_TRUE(match.day.empty());
}

TEST_F(DateMatcherTest, ShortestPrefixWins) {
    DateMatcher matcher(config_);
    DateMatch match;
    ASSERT_TRUE(matcher.find("a2020-01-02b2021-03-04", match));
    EXPECT_EQ("a", match.prefix);
    EXPECT_EQ("2020", match.year);
    EXPECT_EQ("b2021-03-04", match.suffix);
    EXPECT_EQ(1u, matcher.findAll("a2020-01-02b2021-03-04").size());
}

TEST_F(DateMatcherTest, FindAllHoldsWholeName) {
    DateMatcher matcher(config_);
    std::vector<DateMatch> matches = matcher.findAll("x-2020-01-02 then 2021-03-04");
    ASSERT_EQ(1u, matches.size());
    EXPECT_EQ("x", matches[0].prefix);
    EXPECT_EQ(" then 2021-03-04", matches[0].suffix);
    EXPECT_TRUE(matcher.findAll("vacation").empty());
}

TEST_F(DateMatcherTest, FallbackOnlyPrefixesClock) {
    DateMatcher matcher(config_);
    EXPECT_EQ("2019-07-04-Report-2020-03-15", matcher.fallback("Report-2020-03-15", times_));
    EXPECT_EQ("2019-07-04", matcher.fallback("", times_));
}

TEST_F(DateMatcherTest, YearOutsideWindowIsText) {
    DateMatcher matcher(config_);
    DateMatch match;
    EXPECT_FALSE(matcher.find("blah-2100-01-01", match));
    EXPECT_FALSE(matcher.find("blah-1899-01-01", match));
    EXPECT_EQ("2019-07-04-blah-2100-01-01", Normalize("blah-2100-01-01"));
}

TEST_F(DateMatcherTest, FallbackEarliest) {
    EXPECT_EQ("2019-07-04-vacation", Normalize("vacation"));
}

TEST_F(DateMatcherTest, FallbackDiscardName) {
    config_.discardExistingName = true;
    EXPECT_EQ("2019-07-04", Normalize("vacation"));
}

TEST_F(DateMatcherTest, FallbackWithTime) {
    config_.addTime = true;
    EXPECT_EQ("2019-07-04T10-15-42-vacation", Normalize("vacation"));
}

TEST_F(DateMatcherTest, FallbackLatestAndNow) {
    config_.timePolicy = TimePolicy::latest;
    EXPECT_EQ("2020-01-01-vacation", Normalize("vacation"));
    config_.timePolicy = TimePolicy::now;
    EXPECT_EQ("2024-11-20-vacation", Normalize("vacation"));
}

TEST_F(DateMatcherTest, FallbackBlankName) {
    EXPECT_EQ("2019-07-04", Normalize("   "));
}

TEST_F(DateMatcherTest, DiscardNameKeepsOnlyDate) {
    config_.discardExistingName = true;
    EXPECT_EQ("2020-03-15", Normalize("Report-2020-03-15-final"));
    EXPECT_EQ("2020-03-15T12-34-56", Normalize("IMG_20200315_123456"));
}

TEST_F(DateMatcherTest, Idempotent) {
    const char* names[] = {
        "Report-2020-03-15",
        "15-03-2020-Report",
        "March-2020-notes",
        "IMG_20200315_123456",
        "blah_2015_01_01_bling",
        "vacation",
    };
    for (const char* name : names) {
        lstring once = Normalize(name);
        EXPECT_EQ(once, Normalize(once)) << name;
    }

    config_.addTime = true;
    lstring once = Normalize("vacation");
    EXPECT_EQ(once, Normalize(once));
}

TEST_F(DateMatcherTest, ResolveMonth) {
    DateMatcher matcher(config_);
    EXPECT_EQ(3, matcher.resolveMonth("Mar"));
    EXPECT_EQ(3, matcher.resolveMonth("march"));
    EXPECT_EQ(5, matcher.resolveMonth("MAY"));
    EXPECT_EQ(12, matcher.resolveMonth("12"));
    EXPECT_EQ(7, matcher.resolveMonth("7"));
    EXPECT_THROW(matcher.resolveMonth("Smarch"), std::logic_error);
    EXPECT_THROW(matcher.resolveMonth("13"), std::logic_error);
}

TEST_F(DateMatcherTest, RewriteUnknownMonthThrows) {
    DateMatcher matcher(config_);
    DateMatch match;
    match.layout = DateLayout::monthNameYear;
    match.year = "2020";
    match.month = "Brumaire";
    EXPECT_THROW(matcher.rewrite(match), std::logic_error);
}

TEST_F(DateMatcherTest, RewriteFromTaggedMatch) {
    DateMatcher matcher(config_);
    DateMatch match;
    match.layout = DateLayout::dayFirst;
    match.year = "2019";
    match.month = "feb";
    match.day = "3";
    match.hour = "07";
    match.minute = "05";
    match.prefix = "scan";
    match.suffix = "_page1";
    EXPECT_EQ("2019-02-03T07-05-scan-page1", matcher.rewrite(match));
}

TEST_F(DateMatcherTest, FreeFunctionMatchesMatcher) {
    EXPECT_EQ(Normalize("Report-2020-03-15"),
              normalizeDateTimeInName("Report-2020-03-15", config_, times_));
    EXPECT_EQ("2019-07-04-vacation", normalizeDateTimeInName("vacation", config_, times_));
}

}  // namespace
