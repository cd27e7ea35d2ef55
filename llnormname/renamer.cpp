//-------------------------------------------------------------------------------------------------
// File: renamer.cpp
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

#include "renamer.hpp"
#include "directory.hpp"
#include "colors.hpp"

#include <stdio.h>
#include <errno.h>
#include <string.h>
#include <iostream>

// ---------------------------------------------------------------------------
static bool differOnlyInCase(const lstring& name1, const lstring& name2) {
    if (name1 == name2)
        return false;
    lstring lower1(name1);
    lstring lower2(name2);
    return lower1.toLower() == lower2.toLower();
}

// ---------------------------------------------------------------------------
bool Renamer::doRename(const lstring& oldPath, const lstring& newPath) {
    lstring dir, oldName, newName;
    DirUtil::getDir(dir, oldPath);
    DirUtil::getName(oldName, oldPath);
    DirUtil::getName(newName, newPath);

    if (DirUtil::fileExists(newPath)
        && !(differOnlyInCase(oldName, newName) && DirUtil::sameFile(oldPath, newPath))) {
        Colors::showError("New file already exists:", newPath);
        errorCnt++;
        return false;
    }

    if (dryRun) {
        std::cout << "Would rename " << oldPath << " to " << newPath << std::endl;
        renameCnt++;
        return true;
    }

    lstring absDir = DirUtil::absolute(dir);
    if (::rename(oldPath.c_str(), newPath.c_str()) != 0) {
        Colors::showError(strerror(errno), " rename ", oldPath, " to ", newPath);
        errorCnt++;
        return false;
    }
    renameCnt++;

    if (verbose) {
        std::cout << "Renamed " << oldPath << " to " << newPath << std::endl;
    }

    if (undoLog.isOpen()
        && !undoLog.record(DirUtil::join(absDir, oldName), DirUtil::join(absDir, newName))) {
        Colors::showError("Failed to write undo log ", undoLog.getPath());
        errorCnt++;
    }
    return true;
}
