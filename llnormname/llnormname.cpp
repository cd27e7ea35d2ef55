//-------------------------------------------------------------------------------------------------
//
//  llnormname    Dec-2024       Dennis Lang
//
//  Normalize file names, date prefix and lowercase extension
//
//-------------------------------------------------------------------------------------------------
//
// Author: Dennis Lang - 2024
// https://landenlabs.com/
//
// ----- License ----
//
// Copyright (c) 2024 Dennis Lang
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

// Project files
#include "ll_stdhdr.hpp"
#include "signals.hpp"
#include "colors.hpp"
#include "dirscan.hpp"
#include "directory.hpp"
#include "parseutil.hpp"
#include "datename.hpp"
#include "namer.hpp"
#include "undolog.hpp"
#include "prompt.hpp"
#include "renamer.hpp"

#include <stdio.h>
#include <errno.h>
#include <string.h>
#include <iostream>
#include <memory>
#include <regex>
#include <exception>

using namespace std;

#define VERSION  "v1.2"

// Runtime options
static bool verbose = false;
static bool dryRun = false;
static bool interactive = false;
static bool prefixDate = true;
static bool lowercaseExt = true;
static bool defaultExcludes = true;
static unsigned maxYearsAhead = 5;
static unsigned maxYearsBehind = 30;

static lstring undoLogPath = UndoLog::defaultPath();
static UndoLog undoLog;

static DateConfig dateConfig;
static std::unique_ptr<FileNamer> fileNamer;
static std::unique_ptr<Renamer> renamer;
static Prompter prompter(std::cin, std::cout);

static unsigned errorCnt = 0;

// Names skipped unless -all
static const char* DEFAULT_EXCLUDES[] = {
    "\\..*",
    "Thumbs\\.db",
    "desktop\\.ini",
    "Icon\r",
};

// ---------------------------------------------------------------------------
static bool doNormalize(const lstring& filepath, const lstring& filename, bool isDir) {
    FileTimes times;
    if (!FileTimes::fromPath(times, filepath)) {
        Colors::showError(strerror(errno), ", ", filepath);
        errorCnt++;
        return false;
    }

    lstring newName;
    FileNamer::Result result = FileNamer::unchanged;
    try {
        result = fileNamer->newName(newName, filename, isDir, times);
    } catch (const std::exception& ex) {
        Colors::showError("Internal error, ", ex.what(), ", skipping ", filepath);
        errorCnt++;
        return false;
    }

    if (result == FileNamer::implausible) {
        if (verbose)
            std::cerr << "Skipping, date outside valid years: " << filepath << std::endl;
        return false;
    }
    if (result == FileNamer::unchanged) {
        if (verbose)
            std::cerr << "Unchanged " << filepath << std::endl;
        return false;
    }

    if (interactive) {
        switch (prompter.ask(filepath, newName)) {
        case Prompter::yes:
            if (newName == filename)
                return false;
            break;
        case Prompter::no:
            return false;
        case Prompter::quit:
            Signals::aborted = 1;
            return false;
        }
    }

    lstring dir;
    DirUtil::getDir(dir, filepath);
    return renamer->doRename(filepath, DirUtil::join(dir, newName));
}

// ---------------------------------------------------------------------------
static bool HandleFile(const lstring& filepath, const lstring& filename) {
    if (Signals::aborted)
        return false;
    return doNormalize(filepath, filename, false);
}

//-------------------------------------------------------------------------------------------------
static bool HandleDir(const lstring& dirpath, bool onEntry) {
    if (onEntry) {
        if (verbose)
            std::cerr << "Scanning " << dirpath << std::endl;
        return true;
    }
    if (Signals::aborted)
        return false;

    lstring name;
    DirUtil::getName(name, dirpath);
    return doNormalize(dirpath, name, true);
}

//-------------------------------------------------------------------------------------------------
void showHelp(const char* arg0) {
    const char* helpMsg =
        "  Dennis Lang "  VERSION  " (LandenLabs.com)_X_ " __DATE__ "\n\n"
        "\nDes: Normalize file names, date prefix and lowercase extension\n"
        "Use: llnormname [options] directories...   or  files\n"
        "\n"
        " _p_Options (only first unique characters required, options can be repeated):\n"
        "   -_y_recurse                     ; Recurse into directories \n"
        "   -_y_depth=<n>                   ; Limit recurse depth, def=0 no limit \n"
        "   -_y_noaction                    ; No rename, dry run \n"
        "   -_y_interactive                 ; Ask y/n/e/q before each rename \n"
        "   -_y_noPrefixDate                ; Do not add or normalize date prefix \n"
        "   -_y_discardName                 ; Drop existing name, keep only date \n"
        "   -_y_addTime                     ; Add time to date taken from clock \n"
        "   -_y_time=now|earliest|latest    ; Clock used if name has no date, def=earliest \n"
        "                                      earliest/latest of file ctime and mtime \n"
        "   -_y_maxYearsAhead=<n>           ; Valid years end before now+n, def=5 \n"
        "   -_y_maxYearsBehind=<n>          ; Valid years start at now-n, def=30 \n"
        "   -_y_keepExtCase                 ; Do not lowercase extension \n"
        "   -_y_all                         ; Include hidden and system files \n"
        "   -_y_exclude=<namePattern>       ; Exclude files or dirs by regex match \n"
        "   -_y_undoLog=<path>              ; Undo script, def=$HOME/" ".llnormname_undo.sh \n"
        "                                      empty value disables log \n"
        "\n"
        " _p_Debug:\n"
        "   -_y_verbose                     ; Show settings and each rename \n"
        "\n"
        " _p_Example: \n"
        "  llnormname Report-2020-03-15.TXT      ; 2020-03-15-Report.txt \n"
        "  llnormname -_y_r -_y_exc=\\*.bak dir1 dir2 \n"
        "  llnormname -_y_disc -_y_addT -_y_time=latest scans/*.pdf \n"
        " _p_Undo: \n"
        "  tac ~/.llnormname_undo.sh | sh \n"
        "\n"
        "   The exclude regular expression internally converts \n"
        "      * to .*   and  ?  to . \n"
        "     Ex:  *.png  is internally .*.png \n"
        "\n";

    std::cerr << Colors::colorize("\n_W_") << arg0 << Colors::colorize(helpMsg);
}

// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    Signals::init();
    ParseUtil parser;
    Dirscan dirscan(HandleDir, HandleFile);
    StringList pathList;

    if (argc == 1) {
        showHelp(argv[0]);
        return 0;
    }

    bool doParseCmds = true;
    string endCmds = "--";
    for (int argn = 1; argn < argc; argn++) {
        if (*argv[argn] == '-' && doParseCmds) {
            lstring argStr(argv[argn]);
            Split cmdValue(argStr, "=", 2);
            if (cmdValue.size() == 2) {
                lstring cmd = cmdValue[0];
                lstring value = cmdValue[1];

                if (cmd.length() > 1 && cmd[1] == '-')
                    cmd.erase(0, 1);   // allow -- prefix on commands

                const char* cmdName = cmd.c_str() + 1;
                switch (*cmdName) {
                case 'd':   // -depth=<n>
                    parser.validNumber(dirscan.maxDepth, value, "depth", cmdName);
                    break;
                case 'e':   // -exclude=<pat>
                    parser.validPattern(dirscan.excludePatList, ParseUtil::convertSpecialChar(value.c_str()), "exclude", cmdName);
                    break;
                case 'm':
                    if (parser.validOption("maxYearsAhead", cmdName, false)) {
                        parser.validNumber(maxYearsAhead, value, "maxYearsAhead", cmdName);
                    } else {
                        parser.validNumber(maxYearsBehind, value, "maxYearsBehind", cmdName);
                    }
                    break;
                case 't':   // -time=now|earliest|latest
                    if (parser.validOption("time", cmdName)) {
                        if (!parseTimePolicy(dateConfig.timePolicy, value)) {
                            Colors::showError("Invalid -time=", value, ", expect now, earliest or latest");
                            parser.optionErrCnt++;
                        }
                    }
                    break;
                case 'u':   // -undoLog=<path>
                    if (parser.validOption("undoLog", cmdName)) {
                        undoLogPath = value;
                    }
                    break;
                default:
                    parser.showUnknown(argStr.c_str());
                    break;
                }
            } else {
                const char* cmdName = argStr.c_str() + 1;
                if (*cmdName == '-' && cmdName[1] != '\0')
                    cmdName++;  // allow -- prefix on commands
                switch (*cmdName) {
                case 'v':   // verbose
                    verbose = true;
                    break;
                case 'n':
                    if (parser.validOption("noaction", cmdName, false)) {
                        std::cerr << "DryRun\n";
                        dryRun = true;
                    } else if (parser.validOption("noPrefixDate", cmdName)) {
                        prefixDate = false;
                    }
                    break;
                case 'a':
                    if (parser.validOption("addTime", cmdName, false)) {
                        dateConfig.addTime = true;
                    } else if (parser.validOption("all", cmdName)) {
                        defaultExcludes = false;
                    }
                    break;
                case 'd':   // -discardName
                    if (parser.validOption("discardName", cmdName)) {
                        dateConfig.discardExistingName = true;
                    }
                    break;
                case 'i':   // -interactive
                    if (parser.validOption("interactive", cmdName)) {
                        interactive = true;
                    }
                    break;
                case 'k':   // -keepExtCase
                    if (parser.validOption("keepExtCase", cmdName)) {
                        lowercaseExt = false;
                    }
                    break;
                case 'r':   // -recurse
                    if (parser.validOption("recurse", cmdName)) {
                        dirscan.recurse = true;
                    }
                    break;
                case 'h':
                    if (parser.validOption("help", cmdName)) {
                        showHelp(argv[0]);
                        return 0;
                    }
                    break;
                case '?':
                    showHelp(argv[0]);
                    return 0;
                case '-':   // --  end of options
                    break;
                default:
                    parser.showUnknown(argStr.c_str());
                }

                if (endCmds == argv[argn]) {
                    doParseCmds = false;
                }
            }
        } else {
            // Collect extra arguments for scanning below.
            lstring path(argv[argn]);
            while (path.length() > 1 && path[path.length() - 1] == Directory_files::SLASH_CHAR)
                path.erase(path.length() - 1);
            pathList.push_back(path);
        }
    }

    if (parser.patternErrCnt != 0 || parser.optionErrCnt != 0) {
        return 2;
    }

    if (defaultExcludes) {
        for (const char* pattern : DEFAULT_EXCLUDES)
            dirscan.excludePatList.push_back(std::regex(pattern));
    }

    dateConfig.now = time(nullptr);
    dateConfig.validYears = validYearSet(localYear(dateConfig.now), maxYearsBehind, maxYearsAhead);
    fileNamer.reset(new FileNamer(dateConfig, prefixDate, lowercaseExt));

    if (!dryRun && !undoLogPath.empty() && !undoLog.open(undoLogPath)) {
        Colors::showError(strerror(errno), ", unable to open undo log ", undoLogPath);
        return 1;
    }
    renamer.reset(new Renamer(undoLog, dryRun, verbose));

    if (verbose) {
        std::cout << "--- Settings ---\n";
        if (dryRun) std::cout << "Dry run\n";
        if (interactive) std::cout << "Interactive\n";
        if (dirscan.recurse) std::cout << "Recurse, depth=" << dirscan.maxDepth << "\n";
        if (!prefixDate) std::cout << "No date prefix\n";
        if (dateConfig.discardExistingName) std::cout << "Discard existing name\n";
        if (dateConfig.addTime) std::cout << "Add time\n";
        if (!lowercaseExt) std::cout << "Keep extension case\n";
        if (!defaultExcludes) std::cout << "Include hidden and system files\n";
        std::cout << "Time=" << timePolicyName(dateConfig.timePolicy) << std::endl;
        if (!dateConfig.validYears.empty()) {
            std::cout << "Years=" << *dateConfig.validYears.begin()
                << ".." << *dateConfig.validYears.rbegin() << std::endl;
        }
        std::cout << "UndoLog=" << (undoLog.isOpen() ? undoLogPath : lstring("none")) << std::endl;
        std::cout << "--- End Settings ---\n";
    }

    for (auto const& filePath : pathList) {
        if (Signals::aborted)
            break;
        dirscan.ScanPath(filePath);
    }
    errorCnt += dirscan.errorCnt + renamer->errorCnt;

    if (verbose) {
        std::cerr << (dryRun ? " Would rename=" : " Renamed=") << renamer->renameCnt
            << " Errors=" << errorCnt << std::endl;
    }

    return (errorCnt == 0) ? 0 : 1;
}
