/*
 * optfile Option File Providers Implementation
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <optfile/io/provider.hpp>
#include <cerrno>
#include <cstring>
#include <system_error>
#include <utility>

namespace optfile {

namespace fs = std::filesystem;

namespace {

class FileOptionStream : public OptionStream {
public:
    explicit FileOptionStream(const fs::path& p) : m_in(p, std::ios::in | std::ios::binary), m_path(p) {}
    bool is_open() const { return m_in.is_open(); }
    std::istream& stream() override { return m_in; }
    void close() override {
        if (!m_in.is_open()) return;
        m_in.clear(); // eof/fail from reading to the end
        m_in.close();
        if (m_in.fail()) throw IoError(m_path.string(), "close failed");
    }
private:
    std::ifstream m_in;
    fs::path m_path;
};

class StringOptionStream : public OptionStream {
public:
    explicit StringOptionStream(const std::string& data) : m_in(data) {}
    std::istream& stream() override { return m_in; }
    void close() override {}
private:
    std::istringstream m_in;
};

} // namespace

ScopedOptionStream::ScopedOptionStream(std::unique_ptr<OptionStream> s, std::string name)
    : m_stream(std::move(s)), m_name(std::move(name)) {}

ScopedOptionStream::~ScopedOptionStream() {
    if (!m_stream) return;
    // Only reached on an error path: the primary exception wins.
    try { m_stream->close(); } catch (...) {}
}

void ScopedOptionStream::close() {
    if (!m_stream) return;
    auto s = std::move(m_stream);
    s->close();
}

std::vector<std::string> read_all_lines(std::istream& in, const std::string& name) {
    using traits = std::istream::traits_type;
    std::vector<std::string> lines;
    std::string cur; bool pending = false;
    for (traits::int_type ch = in.get(); !traits::eq_int_type(ch, traits::eof()); ch = in.get()) {
        char c = traits::to_char_type(ch);
        if (c == '\n' || c == '\r') {
            if (c == '\r' && traits::eq_int_type(in.peek(), traits::to_int_type('\n'))) in.get();
            lines.push_back(std::move(cur)); cur.clear(); pending = false;
            continue;
        }
        cur.push_back(c); pending = true;
    }
    if (in.bad()) throw IoError(name, "read failed");
    if (pending) lines.push_back(std::move(cur));
    return lines;
}

fs::path FileSystemProvider::resolve(const std::string& name) const {
    fs::path p(name);
    if (m_base.empty() || p.is_absolute()) return p;
    return m_base / p;
}

std::unique_ptr<OptionStream> FileSystemProvider::open(const std::string& name) {
    fs::path p = resolve(name);
    std::error_code ec;
    if (fs::is_directory(p, ec)) throw IoError(name, "is a directory");
    errno = 0;
    auto s = std::make_unique<FileOptionStream>(p);
    if (!s->is_open()) {
        int err = errno;
        throw IoError(name, err ? std::strerror(err) : "cannot open file");
    }
    return s;
}

std::unique_ptr<OptionStream> InMemoryProvider::open(const std::string& name) {
    auto it = m_files.find(name);
    if (it == m_files.end()) throw IoError(name, "no such file");
    return std::make_unique<StringOptionStream>(it->second);
}

} // namespace optfile
