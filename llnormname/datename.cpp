//-------------------------------------------------------------------------------------------------
// File: datename.cpp
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

#include "datename.hpp"

#include <stdexcept>
#include <stdio.h>
#include <stdlib.h>

// ---------------------------------------------------------------------------
// Clamped to 4 digit years, the only ones a name can hold.
YearSet validYearSet(int nowYear, unsigned maxYearsBehind, unsigned maxYearsAhead) {
    long first = std::max((long)nowYear - (long)maxYearsBehind, (long)MIN_YEAR);
    long last = std::min((long)nowYear + (long)maxYearsAhead, (long)MAX_YEAR + 1);
    YearSet years;
    for (long year = first; year < last; year++) {
        years.insert((int)year);
    }
    return years;
}

// ---------------------------------------------------------------------------
const MonthTable& monthNameTable() {
    static const MonthTable table = {
        { "January", "February", "March", "April", "May", "June",
          "July", "August", "September", "October", "November", "December" },
        { "Jan", "Feb", "Mar", "Apr", "May", "Jun",
          "Jul", "Aug", "Sep", "Oct", "Nov", "Dec" }
    };
    return table;
}

// ---------------------------------------------------------------------------
static inline bool isDigit(const lstring& text, size_t pos) {
    return pos < text.length() && isdigit((unsigned char)text[pos]);
}

static lstring padTwo(int value) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%02d", value);
    return lstring(buf);
}

static bool allDigits(const lstring& text) {
    if (text.empty())
        return false;
    for (size_t idx = 0; idx != text.length(); idx++)
        if (!isdigit((unsigned char)text[idx]))
            return false;
    return true;
}

// ---------------------------------------------------------------------------
DateMatcher::DateMatcher(const DateConfig& _config) : config(_config) {
    for (size_t idx = 0; idx < config.months.names.size(); idx++) {
        lstring word(config.months.names[idx]);
        monthWords.push_back(std::make_pair(word.toLower(), (int)idx + 1));
    }
    for (size_t idx = 0; idx < config.months.abbreviations.size(); idx++) {
        lstring word(config.months.abbreviations[idx]);
        monthWords.push_back(std::make_pair(word.toLower(), (int)idx + 1));
    }
}

// ---------------------------------------------------------------------------
// Date component separator, one of - _ . whitespace, else nothing.
DateMatcher::Positions DateMatcher::separatorsAt(const lstring& text, size_t pos) {
    Positions next;
    if (pos < text.length()) {
        char chr = text[pos];
        if (chr == '-' || chr == '_' || chr == '.' || isspace((unsigned char)chr))
            next.push_back(pos + 1);
    }
    next.push_back(pos);
    return next;
}

// ---------------------------------------------------------------------------
// Separator between date and time, required.
DateMatcher::Positions DateMatcher::dateTimeSeparatorsAt(const lstring& text, size_t pos) {
    Positions next;
    if (text.compare(pos, 4, " at ") == 0)
        next.push_back(pos + 4);
    if (text.compare(pos, 2, ", ") == 0)
        next.push_back(pos + 2);
    if (pos < text.length()) {
        char chr = text[pos];
        if (chr == '-' || chr == '_' || chr == 'T' || isspace((unsigned char)chr))
            next.push_back(pos + 1);
    }
    return next;
}

// ---------------------------------------------------------------------------
bool DateMatcher::twoDigitsAt(const lstring& text, size_t pos, int maxValue, Token& outToken) {
    if (!isDigit(text, pos) || !isDigit(text, pos + 1))
        return false;
    int value = (text[pos] - '0') * 10 + (text[pos + 1] - '0');
    if (value > maxValue)
        return false;
    outToken.end = pos + 2;
    outToken.text = text.substr(pos, 2);
    return true;
}

// ---------------------------------------------------------------------------
bool DateMatcher::yearAt(const lstring& text, size_t pos, Token& outYear) const {
    if (pos + 4 > text.length())
        return false;
    lstring year = text.substr(pos, 4);
    if (!allDigits(year) || config.validYears.count(atoi(year.c_str())) == 0)
        return false;
    outYear.end = pos + 4;
    outYear.text = year;
    return true;
}

// ---------------------------------------------------------------------------
// 01-31 or a lone digit 1-9.
bool DateMatcher::dayAt(const lstring& text, size_t pos, Token& outDay) const {
    if (twoDigitsAt(text, pos, 31, outDay) && outDay.text != "00")
        return true;
    if (isDigit(text, pos) && text[pos] != '0' && !isDigit(text, pos + 1)) {
        outDay.end = pos + 1;
        outDay.text = text.substr(pos, 1);
        return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
// Candidates in preference order: 01-12, lone digit 1-9, full name, abbreviation.
DateMatcher::Tokens DateMatcher::monthsAt(const lstring& text, size_t pos, bool allowNumeric) const {
    Tokens months;
    Token month;
    if (allowNumeric) {
        if (twoDigitsAt(text, pos, 12, month) && month.text != "00") {
            months.push_back(month);
        } else if (isDigit(text, pos) && text[pos] != '0' && !isDigit(text, pos + 1)) {
            month.end = pos + 1;
            month.text = text.substr(pos, 1);
            months.push_back(month);
        }
    }

    for (const auto& word : monthWords) {
        size_t len = word.first.length();
        if (len == 0 || pos + len > text.length())
            continue;
        lstring candidate = text.substr(pos, len);
        lstring lower(candidate);
        if (lower.toLower() == word.first) {
            month.end = pos + len;
            month.text = candidate;
            months.push_back(month);
        }
    }
    return months;
}

// ---------------------------------------------------------------------------
// Optional HOUR [sep MINUTE [sep SECOND]], returns end of matched text.
size_t DateMatcher::matchTime(const lstring& text, size_t pos, DateMatch& match) const {
    for (size_t hourPos : dateTimeSeparatorsAt(text, pos)) {
        Token hour;
        if (!twoDigitsAt(text, hourPos, 23, hour))
            continue;

        match.hour = hour.text;
        size_t end = hour.end;
        for (size_t minutePos : separatorsAt(text, end)) {
            Token minute;
            if (!twoDigitsAt(text, minutePos, 59, minute))
                continue;

            match.minute = minute.text;
            end = minute.end;
            for (size_t secondPos : separatorsAt(text, end)) {
                Token second;
                if (twoDigitsAt(text, secondPos, 59, second)) {
                    match.second = second.text;
                    end = second.end;
                    break;
                }
            }
            break;
        }
        return end;
    }
    return pos;
}

// ---------------------------------------------------------------------------
bool DateMatcher::matchYearFirst(const lstring& text, size_t pos, DateMatch& outMatch, size_t& outEnd) const {
    Token year;
    if (!yearAt(text, pos, year))
        return false;

    for (size_t monthPos : separatorsAt(text, year.end)) {
        Tokens months = monthsAt(text, monthPos, true);
        if (months.empty())
            continue;

        // Remainder is optional, first month candidate always completes the match.
        DateMatch match;
        match.layout = DateLayout::yearFirst;
        match.year = year.text;
        match.month = months.front().text;
        size_t end = months.front().end;
        for (size_t dayPos : separatorsAt(text, end)) {
            Token day;
            if (dayAt(text, dayPos, day)) {
                match.day = day.text;
                end = day.end;
                break;
            }
        }
        outEnd = matchTime(text, end, match);
        outMatch = match;
        return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
bool DateMatcher::matchDayFirst(const lstring& text, size_t pos, DateMatch& outMatch, size_t& outEnd) const {
    Token day;
    if (!dayAt(text, pos, day))
        return false;

    for (size_t monthPos : separatorsAt(text, day.end)) {
        for (const Token& month : monthsAt(text, monthPos, true)) {
            for (size_t yearPos : separatorsAt(text, month.end)) {
                Token year;
                if (!yearAt(text, yearPos, year))
                    continue;

                DateMatch match;
                match.layout = DateLayout::dayFirst;
                match.year = year.text;
                match.month = month.text;
                match.day = day.text;
                outEnd = matchTime(text, year.end, match);
                outMatch = match;
                return true;
            }
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
bool DateMatcher::matchMonthNameYear(const lstring& text, size_t pos, DateMatch& outMatch, size_t& outEnd) const {
    for (const Token& month : monthsAt(text, pos, false)) {
        for (size_t yearPos : separatorsAt(text, month.end)) {
            Token year;
            if (!yearAt(text, yearPos, year))
                continue;

            DateMatch match;
            match.layout = DateLayout::monthNameYear;
            match.year = year.text;
            match.month = month.text;
            outEnd = matchTime(text, year.end, match);
            outMatch = match;
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
bool DateMatcher::matchAt(const lstring& text, size_t pos, DateMatch& outMatch, size_t& outEnd) const {
    static const LayoutMatcher layouts[] = {
        &DateMatcher::matchYearFirst,
        &DateMatcher::matchDayFirst,
        &DateMatcher::matchMonthNameYear
    };

    for (LayoutMatcher layout : layouts) {
        if ((this->*layout)(text, pos, outMatch, outEnd))
            return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
bool DateMatcher::find(const lstring& name, DateMatch& outMatch) const {
    for (size_t pos = 0; pos < name.length(); pos++) {
        size_t end = 0;
        bool found = false;
        // One - or _ between prefix and date is dropped.
        if (name[pos] == '-' || name[pos] == '_')
            found = matchAt(name, pos + 1, outMatch, end);
        if (!found)
            found = matchAt(name, pos, outMatch, end);

        if (found) {
            outMatch.prefix = name.substr(0, pos);
            outMatch.suffix = name.substr(end);
            return true;
        }
    }
    return false;
}

// ---------------------------------------------------------------------------
// A match absorbs the whole name into prefix and suffix, so at most one.
std::vector<DateMatch> DateMatcher::findAll(const lstring& name) const {
    std::vector<DateMatch> matches;
    DateMatch match;
    if (find(name, match))
        matches.push_back(match);
    return matches;
}

// ---------------------------------------------------------------------------
int DateMatcher::resolveMonth(const lstring& month) const {
    if (allDigits(month)) {
        int value = atoi(month.c_str());
        if (value >= 1 && value <= 12)
            return value;
        throw std::logic_error("Month out of range: " + month);
    }

    lstring lower(month);
    lower.toLower();
    const StringList* tables[] = { &config.months.abbreviations, &config.months.names };
    for (const StringList* table : tables) {
        for (size_t idx = 0; idx < table->size(); idx++) {
            lstring word((*table)[idx]);
            if (word.toLower() == lower)
                return (int)idx + 1;
        }
    }
    throw std::logic_error("Unknown month name: " + month);
}

// ---------------------------------------------------------------------------
lstring DateMatcher::rewrite(const DateMatch& match) const {
    lstring result(match.year);
    result += "-";
    result += padTwo(resolveMonth(match.month));

    switch (match.layout) {
    case DateLayout::yearFirst:
    case DateLayout::dayFirst:
        if (!match.day.empty()) {
            result += "-";
            result += padTwo(atoi(match.day.c_str()));
        }
        break;
    case DateLayout::monthNameYear:
        break;
    }

    if (!match.hour.empty()) {
        result += "T" + match.hour;
        if (!match.minute.empty()) {
            result += "-" + match.minute;
            if (!match.second.empty())
                result += "-" + match.second;
        }
    }

    if (!config.discardExistingName) {
        if (!match.prefix.empty())
            result += "-" + match.prefix;
        lstring suffix(match.suffix);
        if (!suffix.empty() && suffix[0] == '_')
            suffix[0] = '-';
        result += suffix;
    }
    return result;
}

// ---------------------------------------------------------------------------
lstring DateMatcher::normalize(const lstring& nameWithoutExtension, const FileTimes& times) const {
    DateMatch match;
    if (find(nameWithoutExtension, match)) {
        return rewrite(match);
    }
    return fallback(nameWithoutExtension, times);
}

// ---------------------------------------------------------------------------
lstring DateMatcher::fallback(const lstring& nameWithoutExtension, const FileTimes& times) const {
    time_t when = resolveFallbackInstant(config.timePolicy, config.now, times);
    lstring result = formatInstant(when, config.addTime);
    lstring trimmed(nameWithoutExtension);
    if (!config.discardExistingName && !trimmed.trim().empty()) {
        result += "-" + nameWithoutExtension;
    }
    return result;
}

// ---------------------------------------------------------------------------
lstring normalizeDateTimeInName(const lstring& nameWithoutExtension, const DateConfig& config, const FileTimes& times) {
    DateMatcher matcher(config);
    return matcher.normalize(nameWithoutExtension, times);
}
