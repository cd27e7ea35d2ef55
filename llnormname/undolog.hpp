//-------------------------------------------------------------------------------------------------
// File: undolog.hpp
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

#pragma once

#include "ll_stdhdr.hpp"

#include <fstream>

// ---------------------------------------------------------------------------
// Append-only shell script of mv commands which reverse each rename.
// Replay the commands in reverse order to undo a run, ex:
//     tail -r ~/.llnormname_undo.sh | sh      (or tac on Linux)
class UndoLog {
public:
    UndoLog() : headerWritten(false) {}

    bool open(const lstring& path);
    bool isOpen() const { return outStream.is_open(); }
    const lstring& getPath() const { return logPath; }

    // Record rename of oldPath to newPath, paths should be absolute.
    bool record(const lstring& oldPath, const lstring& newPath);

    // Wrap in single quotes, embedded ' becomes '\''
    static lstring shellQuote(const lstring& str);

    // $HOME/.llnormname_undo.sh or empty if HOME is not set.
    static lstring defaultPath();

private:
    std::ofstream outStream;
    lstring logPath;
    bool headerWritten;
};
