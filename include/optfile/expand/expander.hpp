/*
 * optfile Expansion Interface
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Expands argument lists containing @file references. Every argument that
 *   starts with '@' is replaced in place by the tokens of the named option
 *   file, each of which is expanded again (nested @file to any depth). There
 *   is no cycle detection: a file that references itself recurses until the
 *   process runs out of resources.
 */
#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include "optfile/io/provider.hpp"

namespace optfile {

struct ExpanderOptions {
    bool trace = false; // log each opened option file to stderr
};

class Expander {
public:
    explicit Expander(OptionFileProvider& provider, ExpanderOptions opts = {})
        : m_provider(provider), m_opts(opts) {}

    // Returns a new list; args is left untouched. Throws IoError or
    // TokenizationError, in which case nothing is returned.
    std::vector<std::string> expand_arguments(const std::vector<std::string>& args) const;

    // Appends the expansion of a single argument to out. On failure out may
    // already hold part of the expansion.
    void expand_argument(const std::string& arg, std::vector<std::string>& out) const;

private:
    void expand_argument(const std::string& arg, std::vector<std::string>& out, std::size_t depth) const;

    OptionFileProvider& m_provider;
    ExpanderOptions m_opts;
};

// Shorthand for Expander(provider).expand_arguments(args).
std::vector<std::string> expand_arguments(OptionFileProvider& provider, const std::vector<std::string>& args);

} // namespace optfile
