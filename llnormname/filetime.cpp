//-------------------------------------------------------------------------------------------------
// File: filetime.cpp
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

#include "filetime.hpp"

#include <sys/types.h>
#include <sys/stat.h>

#ifdef HAVE_WIN
#define localtime_r(timep, result) localtime_s(result, timep)
#endif

// ---------------------------------------------------------------------------
bool FileTimes::fromPath(FileTimes& outTimes, const lstring& path) {
    struct stat info;
    if (lstat(path.c_str(), &info) != 0) {
        return false;
    }
    outTimes.ctime = info.st_ctime;
    outTimes.mtime = info.st_mtime;
    return true;
}

// ---------------------------------------------------------------------------
bool parseTimePolicy(TimePolicy& outPolicy, const lstring& value) {
    lstring lower(value);
    lower.toLower();
    if (lower == "now") {
        outPolicy = TimePolicy::now;
    } else if (lower == "earliest") {
        outPolicy = TimePolicy::earliest;
    } else if (lower == "latest") {
        outPolicy = TimePolicy::latest;
    } else {
        return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
const char* timePolicyName(TimePolicy policy) {
    switch (policy) {
    case TimePolicy::now:      return "now";
    case TimePolicy::earliest: return "earliest";
    case TimePolicy::latest:   return "latest";
    }
    return "?";
}

// ---------------------------------------------------------------------------
time_t resolveFallbackInstant(TimePolicy policy, time_t now, const FileTimes& times) {
    switch (policy) {
    case TimePolicy::earliest:
        return std::min(times.ctime, times.mtime);
    case TimePolicy::latest:
        return std::max(times.ctime, times.mtime);
    case TimePolicy::now:
        break;
    }
    return now;
}

// ---------------------------------------------------------------------------
int localYear(time_t when) {
    struct tm tmLocal;
    localtime_r(&when, &tmLocal);
    return tmLocal.tm_year + 1900;
}

// ---------------------------------------------------------------------------
lstring formatInstant(time_t when, bool withTime) {
    struct tm tmLocal;
    localtime_r(&when, &tmLocal);
    char buf[40];
    strftime(buf, sizeof(buf), withTime ? "%Y-%m-%dT%H-%M-%S" : "%Y-%m-%d", &tmLocal);
    return lstring(buf);
}
