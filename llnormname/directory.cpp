//-------------------------------------------------------------------------------------------------
// File: directory.cpp
// Author: Dennis Lang
//
// Desc: Directory listing and path helpers

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

#include "directory.hpp"

#include <dirent.h>
#include <limits.h>
#include <stdlib.h>

// ---------------------------------------------------------------------------
Directory_files::Directory_files(const lstring& _dirName) :
    dirName(_dirName), index(0), readOkay(false) {
    DIR* pDir = opendir(dirName.c_str());
    if (pDir == nullptr) {
        return;
    }

    struct dirent* pEntry;
    while ((pEntry = readdir(pDir)) != nullptr) {
        lstring name(pEntry->d_name);
        if (name == "." || name == "..")
            continue;
        Entry entry;
        entry.name = name;
        entry.isDir = DirUtil::isDir(DirUtil::join(dirName, name));
        entries.push_back(entry);
    }
    closedir(pDir);

    std::sort(entries.begin(), entries.end());
    readOkay = true;
}

// ---------------------------------------------------------------------------
bool Directory_files::more() {
    if (!readOkay || index >= entries.size()) {
        return false;
    }
    index++;
    return true;
}

// ---------------------------------------------------------------------------
bool Directory_files::is_directory() const {
    return entries[index - 1].isDir;
}

// ---------------------------------------------------------------------------
const lstring& Directory_files::name() const {
    return entries[index - 1].name;
}

// ---------------------------------------------------------------------------
lstring& Directory_files::fullName(lstring& fname) const {
    fname = DirUtil::join(dirName, name());
    return fname;
}

// ---------------------------------------------------------------------------
lstring& DirUtil::getDir(lstring& outDir, const lstring& inPath) {
    size_t pos = inPath.rfind(Directory_files::SLASH_CHAR);
    if (pos == std::string::npos) {
        outDir.clear();
    } else if (pos == 0) {
        outDir = "/";
    } else {
        outDir = inPath.substr(0, pos);
    }
    return outDir;
}

// ---------------------------------------------------------------------------
lstring& DirUtil::getName(lstring& outName, const lstring& inPath) {
    size_t pos = inPath.rfind(Directory_files::SLASH_CHAR);
    if (pos == std::string::npos)
        outName = inPath;
    else
        outName = inPath.substr(pos + 1);
    return outName;
}

// ---------------------------------------------------------------------------
void DirUtil::splitExt(lstring& outBase, lstring& outExt, const lstring& name) {
    size_t dotPos = name.rfind('.');
    size_t firstReal = name.find_first_not_of('.');
    if (dotPos == std::string::npos || firstReal == std::string::npos || dotPos < firstReal) {
        outBase = name;
        outExt.clear();
    } else {
        outBase = name.substr(0, dotPos);
        outExt = name.substr(dotPos);
    }
}

// ---------------------------------------------------------------------------
lstring DirUtil::join(const lstring& dir, const lstring& name) {
    if (dir.empty())
        return name;
    if (dir[dir.length() - 1] == Directory_files::SLASH_CHAR)
        return dir + name;
    lstring path(dir);
    path += Directory_files::SLASH_CHAR;
    path += name;
    return path;
}

// ---------------------------------------------------------------------------
bool DirUtil::fileExists(const lstring& path) {
    struct stat info;
    return lstat(path.c_str(), &info) == 0;
}

// ---------------------------------------------------------------------------
// Symbolic links are not followed, a link to a directory is renamed as a file.
bool DirUtil::isDir(const lstring& path) {
    struct stat info;
    return lstat(path.c_str(), &info) == 0 && S_ISDIR(info.st_mode);
}

// ---------------------------------------------------------------------------
// True if both paths name the same inode, ex: case-only rename on macOS.
bool DirUtil::sameFile(const lstring& path1, const lstring& path2) {
    struct stat info1, info2;
    if (lstat(path1.c_str(), &info1) != 0 || lstat(path2.c_str(), &info2) != 0)
        return false;
    return info1.st_dev == info2.st_dev && info1.st_ino == info2.st_ino;
}

// ---------------------------------------------------------------------------
lstring DirUtil::absolute(const lstring& path) {
    char buf[PATH_MAX];
    const char* dir = path.empty() ? "." : path.c_str();
    if (realpath(dir, buf) == nullptr) {
        return path;
    }
    return lstring(buf);
}
