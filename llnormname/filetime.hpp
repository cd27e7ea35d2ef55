//-------------------------------------------------------------------------------------------------
// File: filetime.hpp
// Author: Dennis Lang
//
// Desc: Fallback clock for names without a date

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

#include <time.h>

// Which clock supplies the date when a name carries none.
enum class TimePolicy { now, earliest, latest };

struct FileTimes {
    time_t ctime = 0;   // inode change time
    time_t mtime = 0;   // content modification time

    // Read times without following symbolic links, false and errno set on failure.
    static bool fromPath(FileTimes& outTimes, const lstring& path);
};

bool parseTimePolicy(TimePolicy& outPolicy, const lstring& value);
const char* timePolicyName(TimePolicy policy);

time_t resolveFallbackInstant(TimePolicy policy, time_t now, const FileTimes& times);

int localYear(time_t when);

// YYYY-MM-DD or YYYY-MM-DDTHH-MM-SS in local time.
lstring formatInstant(time_t when, bool withTime);
