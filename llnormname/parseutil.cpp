//-------------------------------------------------------------------------------------------------
// File: parseutil.cpp
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

#include "parseutil.hpp"
#include "colors.hpp"

#include <errno.h>
#include <limits.h>
#include <stdlib.h>
#include <string.h>

// ---------------------------------------------------------------------------
bool ParseUtil::validOption(const char* fullName, const char* cmdName, bool reportErr) {
    size_t cmdLen = strlen(cmdName);
    if (cmdLen != 0 && cmdLen <= strlen(fullName) && strncmp(fullName, cmdName, cmdLen) == 0) {
        return true;
    }

    if (reportErr) {
        Colors::showError("Unknown option:'", cmdName, "', expect:'", fullName, "'");
        optionErrCnt++;
    }
    return false;
}

// ---------------------------------------------------------------------------
bool ParseUtil::validPattern(PatternList& outList, const lstring& value, const char* fullName, const char* cmdName) {
    if (!validOption(fullName, cmdName)) {
        return false;
    }

    try {
        outList.push_back(getRegEx(value.c_str()));
        return true;
    } catch (const std::regex_error& ex) {
        Colors::showError("Invalid regular expression ", ex.what(), ", Pattern=", value);
        patternErrCnt++;
    }
    return false;
}

// ---------------------------------------------------------------------------
bool ParseUtil::validNumber(unsigned& outValue, const lstring& value, const char* fullName, const char* cmdName) {
    if (!validOption(fullName, cmdName)) {
        return false;
    }

    char* endPtr = nullptr;
    errno = 0;
    long number = strtol(value.c_str(), &endPtr, 10);
    if (value.empty() || *endPtr != '\0' || errno == ERANGE || number < 0 || (unsigned long)number > UINT_MAX) {
        Colors::showError("Invalid number for ", fullName, ", value=", value);
        optionErrCnt++;
        return false;
    }
    outValue = (unsigned)number;
    return true;
}

// ---------------------------------------------------------------------------
void ParseUtil::showUnknown(const char* arg) {
    Colors::showError("Unknown option:", arg);
    optionErrCnt++;
}

// ---------------------------------------------------------------------------
lstring ParseUtil::wildcardToRegEx(const char* value) {
    lstring regPat;
    char prevChr = '\0';
    for (const char* ptr = value; *ptr != '\0'; ptr++) {
        char chr = *ptr;
        if (chr == '*' && prevChr != '.' && prevChr != '\\' && prevChr != ']' && prevChr != ')') {
            regPat += ".*";
        } else if (chr == '?' && prevChr != '\\' && prevChr != ']' && prevChr != ')') {
            regPat += ".";
        } else {
            regPat += chr;
        }
        prevChr = chr;
    }
    return regPat;
}

// ---------------------------------------------------------------------------
std::regex ParseUtil::getRegEx(const char* value) {
    return std::regex(wildcardToRegEx(value));
}

// ---------------------------------------------------------------------------
lstring ParseUtil::convertSpecialChar(const char* inPtr) {
    lstring out;
    while (*inPtr != '\0') {
        char chr = *inPtr++;
        if (chr == '\\' && *inPtr != '\0') {
            chr = *inPtr++;
            switch (chr) {
            case 'n': chr = '\n'; break;
            case 't': chr = '\t'; break;
            case 'r': chr = '\r'; break;
            case 'a': chr = '\a'; break;
            }
        }
        out += chr;
    }
    return out;
}
