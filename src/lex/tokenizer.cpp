/*
 * optfile Tokenizer Implementation
 * Copyright (c) 2025 iDev srl
 * Author: Luigi De Astis <l.deastis@idev-srl.com>
 * Description: Converts one option file line into argument tokens. See header
 *              for the quoting rules.
 */
#include <optfile/lex/tokenizer.hpp>
#include <utility>

namespace optfile {

Tokenizer::Tokenizer(std::string input) : m_input(std::move(input)) {}

char Tokenizer::peek() const { return eof() ? '\0' : m_input[m_pos]; }
char Tokenizer::get() { return eof() ? '\0' : m_input[m_pos++]; }
bool Tokenizer::eof() const { return m_pos >= m_input.size(); }

// Only space and tab separate; other control bytes are token text.
bool Tokenizer::is_blank(char c) const { return c == ' ' || c == '\t'; }

void Tokenizer::skip_blanks() { while (!eof() && is_blank(peek())) get(); }

char Tokenizer::escaped(const char* where) {
    if (eof()) throw TokenizationError(std::string("backslash at end of string") + where, m_input);
    return get();
}

std::string Tokenizer::lex_word() {
    std::string out; char quote = '\0';
    while (!eof()) {
        char c = peek();
        if (quote == '\0') {
            if (is_blank(c)) break;
            get();
            if (c=='\'' || c=='"') { quote = c; continue; }
            if (c=='\\') { out.push_back(escaped("")); continue; }
            out.push_back(c);
        } else {
            get();
            if (c == quote) { quote = '\0'; continue; }
            if (c=='\\' && quote=='"') {
                char n = escaped(" (inside double quotes)");
                if (n!='\\' && n!='"') out.push_back('\\');
                out.push_back(n);
                continue;
            }
            out.push_back(c);
        }
    }
    if (quote != '\0') throw TokenizationError("unterminated quotation", m_input);
    return out;
}

std::vector<std::string> Tokenizer::run() {
    std::vector<std::string> tokens;
    while (true) {
        skip_blanks();
        if (eof()) break;
        tokens.push_back(lex_word());
    }
    return tokens;
}

std::vector<std::string> tokenize(const std::string& line) {
    Tokenizer tk(line);
    return tk.run();
}

void tokenize(std::vector<std::string>& out, const std::string& line) {
    auto tokens = tokenize(line);
    out.insert(out.end(), tokens.begin(), tokens.end());
}

} // namespace optfile
