/*
 * optfile Expansion Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 * Description: Recursive @file substitution on top of the providers and the tokenizer.
 */
#include <optfile/expand/expander.hpp>
#include <optfile/lex/tokenizer.hpp>
#include <iostream>

namespace optfile {

std::vector<std::string> Expander::expand_arguments(const std::vector<std::string>& args) const {
    std::vector<std::string> out; out.reserve(args.size());
    for (auto &a : args) expand_argument(a, out, 0);
    return out;
}

void Expander::expand_argument(const std::string& arg, std::vector<std::string>& out) const {
    expand_argument(arg, out, 0);
}

void Expander::expand_argument(const std::string& arg, std::vector<std::string>& out, std::size_t depth) const {
    if (arg.empty() || arg[0] != '@') { out.push_back(arg); return; }
    std::string name = arg.substr(1);
    if (m_opts.trace) std::cerr << "optfile: [" << depth << "] expanding @" << name << std::endl;

    // The handle stays open until everything this file references is expanded.
    ScopedOptionStream in(m_provider.open(name), name);
    // TODO: join lines ending in an escaped newline before tokenizing.
    auto lines = read_all_lines(in.stream(), name);
    std::size_t lineno = 0;
    for (auto &line : lines) {
        ++lineno;
        std::vector<std::string> tokens;
        try {
            tokens = tokenize(line);
        } catch (const TokenizationError& e) {
            throw TokenizationError(e, name, lineno);
        }
        for (auto &t : tokens) expand_argument(t, out, depth + 1);
    }
    in.close();
}

std::vector<std::string> expand_arguments(OptionFileProvider& provider, const std::vector<std::string>& args) {
    return Expander(provider).expand_arguments(args);
}

} // namespace optfile
