//-------------------------------------------------------------------------------------------------
// File: prompt.cpp
// Author: Dennis Lang
//
// Desc: Interactive rename confirmation

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

#include "prompt.hpp"
#include "directory.hpp"

// ---------------------------------------------------------------------------
Prompter::Answer Prompter::ask(const lstring& oldName, lstring& newName) {
    std::string line;
    for (;;) {
        out << "Rename " << oldName << " to " << newName << "? [y/n/e/q] ";
        out.flush();
        if (!std::getline(in, line)) {
            out << std::endl;
            return quit;
        }

        lstring reply(line);
        reply.trim().toLower();
        if (reply == "y" || reply == "yes") {
            return yes;
        } else if (reply == "n" || reply == "no") {
            return no;
        } else if (reply == "q" || reply == "quit") {
            return quit;
        } else if (reply == "e" || reply == "edit") {
            out << "New name [" << newName << "]: ";
            out.flush();
            if (!std::getline(in, line)) {
                out << std::endl;
                return quit;
            }
            lstring edited(line);
            edited.trim();
            if (edited.find(Directory_files::SLASH_CHAR) != std::string::npos) {
                out << "Name may not contain " << Directory_files::SLASH_CHAR << std::endl;
                continue;
            }
            if (!edited.empty())
                newName = edited;
            return yes;
        }
    }
}
