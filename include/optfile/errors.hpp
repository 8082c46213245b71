/*
 * optfile Error Types
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Exceptions raised while expanding option files. IoError covers opening,
 *   reading and closing a referenced resource; TokenizationError covers
 *   malformed quoting in a line. Both derive from OptionFileError so a front
 *   end can report either with a single handler.
 */
#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace optfile {

class OptionFileError : public std::runtime_error {
public:
    explicit OptionFileError(const std::string& what) : std::runtime_error(what) {}
};

class IoError : public OptionFileError {
public:
    IoError(std::string name, const std::string& reason)
        : OptionFileError(name + ": " + reason), m_name(std::move(name)) {}

    // Name of the resource as passed to the provider.
    const std::string& name() const { return m_name; }
private:
    std::string m_name;
};

class TokenizationError : public OptionFileError {
public:
    TokenizationError(const std::string& reason, std::string line)
        : OptionFileError(reason), m_reason(reason), m_line(std::move(line)) {}

    // Same error, located inside an option file (line_number is 1-based).
    TokenizationError(const TokenizationError& cause, std::string file, std::size_t line_number)
        : OptionFileError(file + ":" + std::to_string(line_number) + ": could not tokenize parameter file: " + cause.reason()),
          m_reason(cause.reason()), m_line(cause.line()), m_file(std::move(file)), m_line_number(line_number) {}

    const std::string& reason() const { return m_reason; }
    const std::string& line() const { return m_line; }
    const std::string& file() const { return m_file; } // empty when not wrapped
    std::size_t line_number() const { return m_line_number; } // 0 when not wrapped
private:
    std::string m_reason;
    std::string m_line;
    std::string m_file;
    std::size_t m_line_number = 0;
};

} // namespace optfile
