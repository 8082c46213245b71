/*
 * optfile Option File Providers
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 *
 * Description:
 *   Abstracts how option files are opened so the expander can read from the
 *   real filesystem or from an in-memory table (tests, embedders). Names are
 *   used verbatim as lookup keys. Content is handled as raw bytes, one char
 *   per byte, so no decoding step can fail.
 */
#pragma once
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <istream>
#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <utility>
#include <vector>
#include "optfile/errors.hpp"

namespace optfile {

// Open read handle on an option file.
class OptionStream {
public:
    virtual ~OptionStream() = default;
    virtual std::istream& stream() = 0;
    // Releases the handle. Throws IoError if the release fails; anything it
    // throws while an error is already propagating is discarded.
    virtual void close() = 0;
};

class OptionFileProvider {
public:
    virtual ~OptionFileProvider() = default;
    // Throws IoError if name cannot be opened.
    virtual std::unique_ptr<OptionStream> open(const std::string& name) = 0;
};

// Holds an OptionStream for one scope. close() releases it and reports
// failures; if the scope is left without close() (an exception is in flight)
// the destructor releases it and discards any release failure.
class ScopedOptionStream {
public:
    ScopedOptionStream(std::unique_ptr<OptionStream> s, std::string name);
    ~ScopedOptionStream();
    ScopedOptionStream(const ScopedOptionStream&) = delete;
    ScopedOptionStream& operator=(const ScopedOptionStream&) = delete;

    std::istream& stream() { return m_stream->stream(); }
    const std::string& name() const { return m_name; }
    void close();
private:
    std::unique_ptr<OptionStream> m_stream;
    std::string m_name;
};

// Reads every line; \n, \r and \r\n terminate a line and are stripped.
// Throws IoError (tagged with name) if the stream fails mid-read.
std::vector<std::string> read_all_lines(std::istream& in, const std::string& name);

// Opens files on disk in binary mode. Relative names resolve against base_dir
// when it is set, otherwise against the current working directory.
class FileSystemProvider : public OptionFileProvider {
public:
    explicit FileSystemProvider(std::filesystem::path base_dir = {}) : m_base(std::move(base_dir)) {}
    std::unique_ptr<OptionStream> open(const std::string& name) override;
    const std::filesystem::path& base_dir() const { return m_base; }
private:
    std::filesystem::path resolve(const std::string& name) const;
    std::filesystem::path m_base;
};

// Name -> content table.
class InMemoryProvider : public OptionFileProvider {
public:
    InMemoryProvider() = default;
    InMemoryProvider(std::initializer_list<std::pair<const std::string, std::string>> files) : m_files(files) {}
    void add(const std::string& name, std::string content) { m_files[name] = std::move(content); }
    bool contains(const std::string& name) const { return m_files.count(name) != 0; }
    std::unique_ptr<OptionStream> open(const std::string& name) override;
private:
    std::map<std::string, std::string> m_files;
};

} // namespace optfile
