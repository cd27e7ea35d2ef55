//-------------------------------------------------------------------------------------------------
// File: signals.cpp
// Author: Dennis Lang
//
// Desc: Trap Ctrl-C so directory walks stop between entries.

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

#include "ll_stdhdr.hpp"
#include "signals.hpp"

volatile sig_atomic_t Signals::aborted = 0;

// ---------------------------------------------------------------------------
static void sigHandler(int /* sig */) {
    // Second Ctrl-C falls through to the default action.
    if (Signals::aborted) {
        signal(SIGINT, SIG_DFL);
        raise(SIGINT);
    }
    Signals::aborted = 1;
}

// ---------------------------------------------------------------------------
void Signals::init() {
    signal(SIGINT, sigHandler);
#ifndef HAVE_WIN
    signal(SIGTERM, sigHandler);
#endif
}
