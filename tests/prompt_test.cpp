//-------------------------------------------------------------------------------------------------
// File: prompt_test.cpp
// Author: Dennis Lang
//
// Desc: Interactive prompt tests

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

#include <sstream>

#include <gtest/gtest.h>

namespace {

class PrompterTest : public testing::Test {
 protected:
    Prompter::Answer Ask(const char* input) {
        in_.str(input);
        in_.clear();
        out_.str("");
        newName_ = "2020-03-15-Report.txt";
        Prompter prompter(in_, out_);
        return prompter.ask("Report-2020-03-15.TXT", newName_);
    }

    std::istringstream in_;
    std::ostringstream out_;
    lstring newName_;
};

TEST_F(PrompterTest, Yes) {
    EXPECT_EQ(Prompter::yes, Ask("y\n"));
    EXPECT_EQ("2020-03-15-Report.txt", newName_);
    EXPECT_EQ("Rename Report-2020-03-15.TXT to 2020-03-15-Report.txt? [y/n/e/q] ", out_.str());
    EXPECT_EQ(Prompter::yes, Ask(" YES \n"));
}

TEST_F(PrompterTest, NoAndQuit) {
    EXPECT_EQ(Prompter::no, Ask("n\n"));
    EXPECT_EQ(Prompter::no, Ask("no\n"));
    EXPECT_EQ(Prompter::quit, Ask("q\n"));
    EXPECT_EQ(Prompter::quit, Ask("quit\n"));
}

TEST_F(PrompterTest, EndOfInputQuits) {
    EXPECT_EQ(Prompter::quit, Ask(""));
}

TEST_F(PrompterTest, UnknownReplyAsksAgain) {
    EXPECT_EQ(Prompter::yes, Ask("x\ny\n"));
    std::string output = out_.str();
    size_t first = output.find("[y/n/e/q]");
    ASSERT_NE(std::string::npos, first);
    EXPECT_NE(std::string::npos, output.find("[y/n/e/q]", first + 1));
}

TEST_F(PrompterTest, EditReplacesName) {
    EXPECT_EQ(Prompter::yes, Ask("e\n2020-03-15-Final.txt\n"));
    EXPECT_EQ("2020-03-15-Final.txt", newName_);
    EXPECT_NE(std::string::npos, out_.str().find("New name [2020-03-15-Report.txt]: "));
}

TEST_F(PrompterTest, EditEmptyKeepsProposal) {
    EXPECT_EQ(Prompter::yes, Ask("e\n\n"));
    EXPECT_EQ("2020-03-15-Report.txt", newName_);
}

TEST_F(PrompterTest, EditRejectsSlash) {
    EXPECT_EQ(Prompter::no, Ask("e\nsub/name.txt\nn\n"));
    EXPECT_EQ("2020-03-15-Report.txt", newName_);
    EXPECT_NE(std::string::npos, out_.str().find("Name may not contain /"));
}

TEST_F(PrompterTest, EditEndOfInputQuits) {
    EXPECT_EQ(Prompter::quit, Ask("e\n"));
}

}  // namespace
