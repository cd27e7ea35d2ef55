//-------------------------------------------------------------------------------------------------
// File: namer.cpp
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

#include "namer.hpp"
#include "directory.hpp"

#include <stdlib.h>

// ---------------------------------------------------------------------------
FileNamer::FileNamer(const DateConfig& config, bool _prefixDate, bool _lowercaseExt) :
    matcher(config),
    prefixDate(_prefixDate),
    lowercaseExt(_lowercaseExt),
    isoDatePat("(^|[^0-9])([0-9]{4})[-_. ]?(0[1-9]|1[0-2])[-_. ]?(0[1-9]|[12][0-9]|3[01])([^0-9]|$)") {
}

// ---------------------------------------------------------------------------
bool FileNamer::hasImplausibleDate(const lstring& body) const {
    const YearSet& validYears = matcher.getConfig().validYears;
    std::sregex_iterator iter(body.begin(), body.end(), isoDatePat);
    std::sregex_iterator endIter;
    for (; iter != endIter; ++iter) {
        int year = atoi((*iter)[2].str().c_str());
        if (validYears.count(year) == 0)
            return true;
    }
    return false;
}

// ---------------------------------------------------------------------------
FileNamer::Result FileNamer::newName(lstring& outName, const lstring& name, bool isDir, const FileTimes& times) const {
    lstring base, extn;
    DirUtil::splitExt(base, extn, name);

    lstring body(base);
    if (prefixDate) {
        DateMatch match;
        if (matcher.find(base, match)) {
            body = matcher.rewrite(match);
        } else if (hasImplausibleDate(base)) {
            outName = name;
            return implausible;
        } else {
            body = matcher.fallback(base, times);
        }
    }

    body.trim();
    if (body.empty()) {
        outName = name;
        return unchanged;
    }

    if (lowercaseExt && !isDir)
        extn.toLower();

    outName = body + extn;
    return (outName == name) ? unchanged : changed;
}
