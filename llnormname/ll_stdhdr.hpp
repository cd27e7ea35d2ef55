//-------------------------------------------------------------------------------------------------
// File: ll_stdhdr.hpp
// Author: Dennis Lang
//
// Desc: Common types shared by the llnormname sources.

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

#include <string>
#include <vector>
#include <algorithm>
#include <ctype.h>

#ifdef _WIN32
#define HAVE_WIN
#endif

// ---------------------------------------------------------------------------
// std::string with a few in-place helpers.
class lstring : public std::string {
public:
    lstring() {}
    lstring(const char* str) : std::string(str) {}
    lstring(const char* str, size_t len) : std::string(str, len) {}
    lstring(const std::string& str) : std::string(str) {}
    lstring(size_t len, char chr) : std::string(len, chr) {}

    lstring& toLower() {
        std::transform(begin(), end(), begin(), [](char c) { return (char)::tolower((unsigned char)c); });
        return *this;
    }
    lstring& toUpper() {
        std::transform(begin(), end(), begin(), [](char c) { return (char)::toupper((unsigned char)c); });
        return *this;
    }

    // Remove leading and trailing whitespace.
    lstring& trim() {
        size_t first = 0;
        while (first < length() && isspace((unsigned char)at(first)))
            first++;
        size_t last = length();
        while (last > first && isspace((unsigned char)at(last - 1)))
            last--;
        assign(substr(first, last - first));
        return *this;
    }

    bool startsWith(const std::string& prefix) const {
        return length() >= prefix.length() && compare(0, prefix.length(), prefix) == 0;
    }
};

typedef std::vector<lstring> StringList;

// ---------------------------------------------------------------------------
// Split string on any of the delimiter characters.
// maxSplit > 0 limits the number of parts, last part holds the remainder.
class Split : public StringList {
public:
    Split(const lstring& str, const char* delims, size_t maxSplit = 0) {
        size_t start = 0;
        for (;;) {
            if (maxSplit != 0 && size() + 1 == maxSplit) {
                push_back(str.substr(start));
                break;
            }
            size_t pos = str.find_first_of(delims, start);
            if (pos == std::string::npos) {
                push_back(str.substr(start));
                break;
            }
            push_back(str.substr(start, pos - start));
            start = pos + 1;
        }
    }
};
