//-------------------------------------------------------------------------------------------------
// File: parseutil.hpp
// Author: Dennis Lang
//
// Desc: Command line option parsing helpers

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

#include <regex>

typedef std::vector<std::regex> PatternList;

class ParseUtil {
public:
    unsigned optionErrCnt = 0;
    unsigned patternErrCnt = 0;

    // True if cmdName is a leading part of fullName, ex "rec" for "recurse".
    // Counts and reports a mismatch when reportErr is set.
    bool validOption(const char* fullName, const char* cmdName, bool reportErr = true);

    // Append wildcard or regex pattern to list.
    bool validPattern(PatternList& outList, const lstring& value, const char* fullName, const char* cmdName);

    // Parse unsigned decimal option value.
    bool validNumber(unsigned& outValue, const lstring& value, const char* fullName, const char* cmdName);

    void showUnknown(const char* arg);

    // Convert user wildcard into regex, * to .* and ? to .
    static std::regex getRegEx(const char* value);
    static lstring wildcardToRegEx(const char* value);

    // Expand \n \t \\ escapes.
    static lstring convertSpecialChar(const char* inPtr);
};
