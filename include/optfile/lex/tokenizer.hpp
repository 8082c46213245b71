/*
 * optfile Tokenizer Module
 *
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 *
 * Description:
 *   Splits a single line of an option file into argument tokens following
 *   conventional shell quoting: unquoted blanks (space, tab) separate tokens,
 *   single quotes keep everything literal, double quotes honor \\ and \" and
 *   a backslash outside quotes escapes the next character. Quoted spans glue
 *   to adjacent text and a quoted empty string produces an empty token.
 *   Unterminated quotes and a trailing backslash raise TokenizationError.
 *
 * License (MIT):
 *   Permission is hereby granted, free of charge, to any person obtaining a copy of this
 *   software and associated documentation files (the "Software"), to deal in the Software
 *   without restriction, including without limitation the rights to use, copy, modify, merge,
 *   publish, distribute, sublicense, and/or sell copies of the Software, and to permit persons
 *   to whom the Software is furnished to do so, subject to the following conditions:
 *
 *   The above copyright notice and this permission notice shall be included in all copies or
 *   substantial portions of the Software.
 *
 *   THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR IMPLIED,
 *   INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY, FITNESS FOR A PARTICULAR
 *   PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE AUTHORS OR COPYRIGHT HOLDERS BE LIABLE
 *   FOR ANY CLAIM, DAMAGES OR OTHER LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR
 *   OTHERWISE, ARISING FROM, OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER
 *   DEALINGS IN THE SOFTWARE.
 */
#pragma once
#include <string>
#include <vector>
#include <cstddef>
#include "optfile/errors.hpp"

namespace optfile {

class Tokenizer {
public:
    explicit Tokenizer(std::string input);
    // Throws TokenizationError on malformed quoting.
    std::vector<std::string> run();
private:
    char peek() const;
    char get();
    bool eof() const;
    bool is_blank(char c) const;
    void skip_blanks();
    std::string lex_word();
    char escaped(const char* where);

    std::string m_input;
    std::size_t m_pos = 0; // current index
};

// Convenience wrappers around Tokenizer::run.
std::vector<std::string> tokenize(const std::string& line);
void tokenize(std::vector<std::string>& out, const std::string& line);

} // namespace optfile
