//-------------------------------------------------------------------------------------------------
// File: namer_test.cpp
// Author: Dennis Lang
//
// Desc: File name assembly tests

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

#include "namer.hpp"
#include "directory.hpp"

#include <time.h>

#include <gtest/gtest.h>

namespace {

time_t LocalDate(int year, int month, int day) {
    struct tm tmLocal = {};
    tmLocal.tm_year = year - 1900;
    tmLocal.tm_mon = month - 1;
    tmLocal.tm_mday = day;
    tmLocal.tm_hour = 9;
    tmLocal.tm_isdst = -1;
    return mktime(&tmLocal);
}

class FileNamerTest : public testing::Test {
 protected:
    void SetUp() override {
        config_.validYears = validYearSet(2024, 30, 5);
        config_.now = LocalDate(2024, 11, 20);
        times_.ctime = LocalDate(2019, 7, 4);
        times_.mtime = LocalDate(2021, 2, 2);
    }

    FileNamer::Result Rename(const lstring& name, lstring& newName,
                             bool isDir = false, bool prefixDate = true, bool lowercaseExt = true) {
        FileNamer namer(config_, prefixDate, lowercaseExt);
        return namer.newName(newName, name, isDir, times_);
    }

    DateConfig config_;
    FileTimes times_;
};

TEST_F(FileNamerTest, DateMovedToFrontAndExtensionLowercased) {
    lstring newName;
    EXPECT_EQ(FileNamer::changed, Rename("Report-2020-03-15.TXT", newName));
    EXPECT_EQ("2020-03-15-Report.txt", newName);
}

TEST_F(FileNamerTest, DayFirstName) {
    lstring newName;
    EXPECT_EQ(FileNamer::changed, Rename("15-03-2020-Report.txt", newName));
    EXPECT_EQ("2020-03-15-Report.txt", newName);
}

TEST_F(FileNamerTest, MonthNameName) {
    lstring newName;
    EXPECT_EQ(FileNamer::changed, Rename("March-2020-notes.txt", newName));
    EXPECT_EQ("2020-03-notes.txt", newName);
}

TEST_F(FileNamerTest, NoDateUsesEarliestFileTime) {
    lstring newName;
    EXPECT_EQ(FileNamer::changed, Rename("vacation.jpg", newName));
    EXPECT_EQ("2019-07-04-vacation.jpg", newName);
}

TEST_F(FileNamerTest, NoDateDiscardName) {
    config_.discardExistingName = true;
    lstring newName;
    EXPECT_EQ(FileNamer::changed, Rename("vacation.jpg", newName));
    EXPECT_EQ("2019-07-04.jpg", newName);
}

TEST_F(FileNamerTest, AlreadyNormalizedIsUnchanged) {
    lstring newName;
    EXPECT_EQ(FileNamer::unchanged, Rename("2020-03-15-Report.txt", newName));
    EXPECT_EQ("2020-03-15-Report.txt", newName);
}

TEST_F(FileNamerTest, ImplausibleYearLeftAlone) {
    lstring newName;
    EXPECT_EQ(FileNamer::implausible, Rename("blah-2100-01-01.txt", newName));
    EXPECT_EQ("blah-2100-01-01.txt", newName);
    EXPECT_EQ(FileNamer::implausible, Rename("blah-1899-01-01.txt", newName));
}

TEST_F(FileNamerTest, ValidDateWinsOverImplausibleOne) {
    lstring newName;
    EXPECT_EQ(FileNamer::changed, Rename("copy-2020-01-01 of 2100-01-01.txt", newName));
    EXPECT_EQ("2020-01-01-copy of 2100-01-01.txt", newName);
}

TEST_F(FileNamerTest, HasImplausibleDate) {
    FileNamer namer(config_, true, true);
    EXPECT_TRUE(namer.hasImplausibleDate("blah-2100-01-01"));
    EXPECT_TRUE(namer.hasImplausibleDate("1850_12_31 letters"));
    EXPECT_FALSE(namer.hasImplausibleDate("blah-2020-01-01"));
    EXPECT_FALSE(namer.hasImplausibleDate("part 12100-01-01x"));
    EXPECT_FALSE(namer.hasImplausibleDate("vacation"));
}

TEST_F(FileNamerTest, DirectoryKeepsExtensionCase) {
    lstring newName;
    EXPECT_EQ(FileNamer::changed, Rename("Holiday-2020-05-06.SET", newName, true));
    EXPECT_EQ("2020-05-06-Holiday.SET", newName);
    EXPECT_EQ(FileNamer::changed, Rename("Holiday-2020-05-06.SET", newName, false));
    EXPECT_EQ("2020-05-06-Holiday.set", newName);
}

TEST_F(FileNamerTest, KeepExtensionCase) {
    lstring newName;
    EXPECT_EQ(FileNamer::changed, Rename("x-2020-01-01.PDF", newName, false, true, false));
    EXPECT_EQ("2020-01-01-x.PDF", newName);
}

TEST_F(FileNamerTest, NoPrefixDateOnlyLowercasesExtension) {
    lstring newName;
    EXPECT_EQ(FileNamer::changed, Rename("Notes.TXT", newName, false, false));
    EXPECT_EQ("Notes.txt", newName);
    EXPECT_EQ(FileNamer::unchanged, Rename("Notes.txt", newName, false, false));
    EXPECT_EQ(FileNamer::changed, Rename("  padded .TXT", newName, false, false));
    EXPECT_EQ("padded.txt", newName);
}

TEST_F(FileNamerTest, TimeInName) {
    lstring newName;
    EXPECT_EQ(FileNamer::changed, Rename("IMG_20200315_123456.JPG", newName));
    EXPECT_EQ("2020-03-15T12-34-56-IMG.jpg", newName);
}

TEST(SplitExtTest, LeadingDotsAreNotExtension) {
    lstring base, extn;
    DirUtil::splitExt(base, extn, "report.final.PDF");
    EXPECT_EQ("report.final", base);
    EXPECT_EQ(".PDF", extn);

    DirUtil::splitExt(base, extn, ".profile");
    EXPECT_EQ(".profile", base);
    EXPECT_EQ("", extn);

    DirUtil::splitExt(base, extn, "..hidden.txt");
    EXPECT_EQ("..hidden", base);
    EXPECT_EQ(".txt", extn);

    DirUtil::splitExt(base, extn, "noext");
    EXPECT_EQ("noext", base);
    EXPECT_EQ("", extn);
}

}  // namespace
