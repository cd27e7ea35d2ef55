//-------------------------------------------------------------------------------------------------
// File: directory.hpp
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

#pragma once

#include "ll_stdhdr.hpp"

#include <sys/types.h>
#include <sys/stat.h>

// ---------------------------------------------------------------------------
// Sorted listing of one directory, skips "." and ".."
class Directory_files {
public:
    static const char SLASH_CHAR = '/';

    Directory_files(const lstring& dirName);

    // Advance to next entry, false when done or directory could not be read.
    bool more();

    bool is_directory() const;
    const lstring& name() const;
    lstring& fullName(lstring& fname) const;

    bool ok() const { return readOkay; }

private:
    struct Entry {
        lstring name;
        bool isDir;
        bool operator<(const Entry& other) const { return name < other.name; }
    };

    lstring dirName;
    std::vector<Entry> entries;
    size_t index;
    bool readOkay;
};

// ---------------------------------------------------------------------------
class DirUtil {
public:
    // Directory part of path without trailing slash, empty if none.
    static lstring& getDir(lstring& outDir, const lstring& inPath);
    // Name part of path (after last slash).
    static lstring& getName(lstring& outName, const lstring& inPath);
    // Split name into base and extension (with its dot). Leading dots do not
    // start an extension, ".profile" has none.
    static void splitExt(lstring& outBase, lstring& outExt, const lstring& name);

    static lstring join(const lstring& dir, const lstring& name);

    static bool fileExists(const lstring& path);
    static bool isDir(const lstring& path);
    static bool sameFile(const lstring& path1, const lstring& path2);

    // Absolute path of an existing directory, input returned on failure.
    static lstring absolute(const lstring& path);
};
