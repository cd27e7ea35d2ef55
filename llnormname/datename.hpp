//-------------------------------------------------------------------------------------------------
// File: datename.hpp
// Author: Dennis Lang
//
// Desc: Find and normalize dates embedded in file names

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

#pragma once

#include "ll_stdhdr.hpp"
#include "filetime.hpp"

#include <set>

typedef std::set<int> YearSet;

const int MIN_YEAR = 1000;
const int MAX_YEAR = 9999;

// Years in [nowYear - maxYearsBehind, nowYear + maxYearsAhead), within MIN_YEAR..MAX_YEAR
YearSet validYearSet(int nowYear, unsigned maxYearsBehind, unsigned maxYearsAhead);

struct MonthTable {
    StringList names;           // January .. December
    StringList abbreviations;   // Jan .. Dec
};

const MonthTable& monthNameTable();

// Fixed for the duration of a run.
struct DateConfig {
    YearSet validYears;
    MonthTable months = monthNameTable();
    bool discardExistingName = false;
    bool addTime = false;
    TimePolicy timePolicy = TimePolicy::earliest;
    time_t now = 0;
};

// Component orderings, in match priority.
enum class DateLayout {
    yearFirst,      // YEAR MONTH [DAY]
    dayFirst,       // DAY MONTH YEAR
    monthNameYear   // MONTH_NAME YEAR
};

struct DateMatch {
    DateLayout layout = DateLayout::yearFirst;
    lstring prefix;     // text before the date, boundary - or _ removed
    lstring suffix;     // text after the date and time
    lstring year;
    lstring month;      // digits or month name as written
    lstring day;        // empty if absent
    lstring hour;
    lstring minute;
    lstring second;
};

// ---------------------------------------------------------------------------
// Locate a date (and optional time) embedded in a file name and rewrite the
// name with a canonical YYYY-MM[-DD][THH[-MM[-SS]]] prefix.
//
// Layouts are tried in DateLayout order at each start position, shortest
// prefix first, the first success wins. Separators between components are
// one of - _ . whitespace or nothing.
class DateMatcher {
public:
    explicit DateMatcher(const DateConfig& config);

    const DateConfig& getConfig() const { return config; }

    // Match the whole name, false if no date found.
    bool find(const lstring& name, DateMatch& outMatch) const;

    // Prefix and suffix take the rest of the name, so this holds zero or one match.
    std::vector<DateMatch> findAll(const lstring& name) const;

    // Month number 1..12 from digits, abbreviation or full name.
    // Throws std::logic_error if the text is not a month.
    int resolveMonth(const lstring& month) const;

    // Build the replacement name body from a match.
    lstring rewrite(const DateMatch& match) const;

    // Rewrite name (without extension), fallback to file or current time
    // if the name holds no date. Throws std::logic_error for an unknown month.
    lstring normalize(const lstring& nameWithoutExtension, const FileTimes& times) const;

    // Date prefix from the file or current time, for names without a date.
    lstring fallback(const lstring& nameWithoutExtension, const FileTimes& times) const;

private:
    struct Token {
        size_t end;
        lstring text;
    };
    typedef std::vector<Token> Tokens;
    typedef std::vector<size_t> Positions;
    typedef bool (DateMatcher::*LayoutMatcher)(const lstring&, size_t, DateMatch&, size_t&) const;

    bool matchAt(const lstring& text, size_t pos, DateMatch& outMatch, size_t& outEnd) const;
    bool matchYearFirst(const lstring& text, size_t pos, DateMatch& outMatch, size_t& outEnd) const;
    bool matchDayFirst(const lstring& text, size_t pos, DateMatch& outMatch, size_t& outEnd) const;
    bool matchMonthNameYear(const lstring& text, size_t pos, DateMatch& outMatch, size_t& outEnd) const;
    size_t matchTime(const lstring& text, size_t pos, DateMatch& match) const;

    bool yearAt(const lstring& text, size_t pos, Token& outYear) const;
    bool dayAt(const lstring& text, size_t pos, Token& outDay) const;
    Tokens monthsAt(const lstring& text, size_t pos, bool allowNumeric) const;
    static Positions separatorsAt(const lstring& text, size_t pos);
    static Positions dateTimeSeparatorsAt(const lstring& text, size_t pos);
    static bool twoDigitsAt(const lstring& text, size_t pos, int maxValue, Token& outToken);

    DateConfig config;
    // Lowercase month words, full names before abbreviations so "march" wins over "mar".
    std::vector<std::pair<lstring, int>> monthWords;
};

// Single shot helper, builds a matcher for the call.
lstring normalizeDateTimeInName(const lstring& nameWithoutExtension, const DateConfig& config, const FileTimes& times);
