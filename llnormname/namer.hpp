//-------------------------------------------------------------------------------------------------
// File: namer.hpp
// Author: Dennis Lang
//
// Desc: Assemble normalized file name, body plus extension

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
#include "datename.hpp"

#include <regex>

// Build the normalized name of one directory entry.
class FileNamer {
public:
    enum Result {
        changed,
        unchanged,
        implausible     // name holds a date outside the valid years, leave it alone
    };

    FileNamer(const DateConfig& config, bool prefixDate, bool lowercaseExt);

    Result newName(lstring& outName, const lstring& name, bool isDir, const FileTimes& times) const;

    // True if body holds YYYY-MM-DD shaped text whose year is not valid.
    bool hasImplausibleDate(const lstring& body) const;

    const DateMatcher& getMatcher() const { return matcher; }

private:
    DateMatcher matcher;
    bool prefixDate;
    bool lowercaseExt;
    std::regex isoDatePat;
};
