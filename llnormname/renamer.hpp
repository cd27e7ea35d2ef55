//-------------------------------------------------------------------------------------------------
// File: renamer.hpp
// Author: Dennis Lang
//
// Desc: Rename one entry and log it for undo

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
#include "undolog.hpp"

// Rename entries within their directory and record each rename in the undo log.
class Renamer {
public:
    Renamer(UndoLog& _undoLog, bool _dryRun, bool _verbose) :
        undoLog(_undoLog), dryRun(_dryRun), verbose(_verbose) {
    }

    // Refuses to replace an existing file, except the same file under a
    // name that differs only in case. Errors are reported and counted.
    bool doRename(const lstring& oldPath, const lstring& newPath);

    unsigned renameCnt = 0;     // done, or would be done on a dry run
    unsigned errorCnt = 0;

private:
    UndoLog& undoLog;
    bool dryRun;
    bool verbose;
};
