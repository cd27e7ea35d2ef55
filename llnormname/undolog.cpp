//-------------------------------------------------------------------------------------------------
// File: undolog.cpp
// Author: Dennis Lang
//
// Desc: Shell script log to undo renames

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

#include "undolog.hpp"
#include "directory.hpp"

#include <stdlib.h>
#include <time.h>
#include <limits.h>
#include <unistd.h>

static const char UNDO_NAME[] = ".llnormname_undo.sh";

// ---------------------------------------------------------------------------
bool UndoLog::open(const lstring& path) {
    logPath = path;
    headerWritten = false;
    outStream.open(path.c_str(), std::ios::out | std::ios::app);
    return outStream.is_open() && outStream.good();
}

// ---------------------------------------------------------------------------
bool UndoLog::record(const lstring& oldPath, const lstring& newPath) {
    if (!isOpen()) {
        return false;
    }

    if (!headerWritten) {
        char cwdBuf[PATH_MAX];
        const char* cwd = getcwd(cwdBuf, sizeof(cwdBuf));
        time_t now = time(nullptr);
        struct tm tmLocal;
        localtime_r(&now, &tmLocal);
        char timeBuf[40];
        strftime(timeBuf, sizeof(timeBuf), "%Y-%m-%d %H:%M:%S", &tmLocal);

        outStream << "# llnormname " << timeBuf << " in " << (cwd != nullptr ? cwd : "?") << "\n";
        headerWritten = true;
    }

    outStream << "mv -- " << shellQuote(newPath) << " " << shellQuote(oldPath) << "\n";
    outStream.flush();
    return outStream.good();
}

// ---------------------------------------------------------------------------
lstring UndoLog::shellQuote(const lstring& str) {
    lstring quoted("'");
    for (char chr : str) {
        if (chr == '\'')
            quoted += "'\\''";
        else
            quoted += chr;
    }
    quoted += "'";
    return quoted;
}

// ---------------------------------------------------------------------------
lstring UndoLog::defaultPath() {
    const char* home = getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return lstring();
    }
    return DirUtil::join(home, UNDO_NAME);
}
