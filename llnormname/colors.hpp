//-------------------------------------------------------------------------------------------------
// File: colors.hpp
// Author: Dennis Lang
//
// Desc: Colorize console output and report errors.

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

#include <iostream>
#include <stdio.h>

#ifdef HAVE_WIN
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

// Color codes embedded in text as _c_ , ex: "_R_error_X_ text"
//   _X_ reset   _R_ red   _G_ green   _Y_ yellow  _B_ blue
//   _M_ magenta _C_ cyan  _W_ white   _y_ yellow option  _p_ _P_ section headers
class Colors {
public:
    // Only emit escape codes when stderr is a terminal.
    static bool enabled() {
        static const bool useColor = isatty(fileno(stderr)) != 0;
        return useColor;
    }

    static lstring colorize(const char* inStr) {
        lstring out;
        for (const char* ptr = inStr; *ptr != '\0'; ptr++) {
            const char* code = nullptr;
            if (ptr[0] == '_' && ptr[1] != '\0' && ptr[2] == '_') {
                code = getCode(ptr[1]);
            }
            if (code != nullptr) {
                if (enabled())
                    out += code;
                ptr += 2;
            } else {
                out += *ptr;
            }
        }
        return out;
    }

    // Write all arguments to cerr in red, then reset color.
    template<typename... Args>
    static void showError(const Args&... args) {
        std::cerr << colorize("_R_");
        writeAll(std::cerr, args...);
        std::cerr << colorize("_X_") << std::endl;
    }

private:
    static const char* getCode(char chr) {
        switch (chr) {
        case 'X': return "\033[0m";
        case 'R': return "\033[01;31m";
        case 'G': return "\033[01;32m";
        case 'Y': return "\033[01;33m";
        case 'B': return "\033[01;34m";
        case 'M': return "\033[01;35m";
        case 'C': return "\033[01;36m";
        case 'W': return "\033[01;37m";
        case 'y': return "\033[00;33m";
        case 'p': return "\033[04;35m";
        case 'P': return "\033[00;35m";
        }
        return nullptr;
    }

    static void writeAll(std::ostream&) {
    }
    template<typename First, typename... Rest>
    static void writeAll(std::ostream& out, const First& first, const Rest&... rest) {
        out << first;
        writeAll(out, rest...);
    }
};
