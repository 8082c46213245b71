/*
 * Provider tests - optfile
 * Copyright (c) 2025 iDev srl - Luigi De Astis <l.deastis@idev-srl.com>
 * MIT License.
 */
#include <gtest/gtest.h>
#include <optfile/io/provider.hpp>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <cerrno>
#include <cstring>
#include <unistd.h>

using namespace optfile;
namespace fs = std::filesystem;
using Lines = std::vector<std::string>;

static Lines lines_of(const std::string& data) {
    std::istringstream in(data);
    return read_all_lines(in, "mem");
}

TEST(ReadLines, Terminators) {
    EXPECT_EQ(lines_of("a\nb\n"), (Lines{"a", "b"}));
    EXPECT_EQ(lines_of("a\r\nb"), (Lines{"a", "b"}));
    EXPECT_EQ(lines_of("a\rb\r"), (Lines{"a", "b"}));
    EXPECT_EQ(lines_of("a\n\nb"), (Lines{"a", "", "b"}));
    EXPECT_TRUE(lines_of("").empty());
}

TEST(ReadLines, HighBytesKeptVerbatim) {
    std::string data = "caf\xe9 \xff\n";
    auto lines = lines_of(data);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "caf\xe9 \xff");
}

TEST(InMemory, OpenKnownAndUnknown) {
    InMemoryProvider p{{"opts", "x y\n"}};
    EXPECT_TRUE(p.contains("opts"));
    auto s = p.open("opts");
    EXPECT_EQ(read_all_lines(s->stream(), "opts"), (Lines{"x y"}));
    try {
        p.open("missing");
        FAIL() << "expected IoError";
    } catch (const IoError& e) {
        EXPECT_EQ(e.name(), "missing");
    }
}

namespace {

struct FlakyStream : OptionStream {
    explicit FlakyStream(int* closes) : m_closes(closes) {}
    std::istream& stream() override { return m_in; }
    void close() override { ++*m_closes; throw IoError("flaky", "close failed"); }
    std::istringstream m_in;
    int* m_closes;
};

struct ThrowsIntStream : OptionStream {
    std::istream& stream() override { return m_in; }
    void close() override { throw 42; }
    std::istringstream m_in{"'bad\n"};
};

} // namespace

TEST(ScopedStream, NonStandardCloseFailureDoesNotTerminate) {
    try {
        ScopedOptionStream s(std::make_unique<ThrowsIntStream>(), "odd");
        auto lines = read_all_lines(s.stream(), s.name());
        throw TokenizationError("unterminated quotation", lines.at(0));
    } catch (const TokenizationError& e) {
        EXPECT_EQ(e.line(), "'bad");
    }
}

TEST(ScopedStream, DestructorSwallowsCloseFailure) {
    int closes = 0;
    EXPECT_NO_THROW({ ScopedOptionStream s(std::make_unique<FlakyStream>(&closes), "flaky"); });
    EXPECT_EQ(closes, 1);
}

TEST(ScopedStream, ExplicitCloseReportsFailureOnce) {
    int closes = 0;
    {
        ScopedOptionStream s(std::make_unique<FlakyStream>(&closes), "flaky");
        EXPECT_THROW(s.close(), IoError);
    }
    EXPECT_EQ(closes, 1);
}

class FileSystemTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("optfile_fs_" + std::to_string(::getpid()));
        fs::create_directories(dir / "sub");
        std::ofstream(dir / "args.txt", std::ios::binary) << "-v \"two words\"\r\n--flag\n";
    }
    void TearDown() override { std::error_code ec; fs::remove_all(dir, ec); }
    fs::path dir;
};

TEST_F(FileSystemTest, AbsolutePath) {
    FileSystemProvider p;
    auto s = p.open((dir / "args.txt").string());
    EXPECT_EQ(read_all_lines(s->stream(), "args.txt"), (Lines{"-v \"two words\"", "--flag"}));
    EXPECT_NO_THROW(s->close());
}

TEST_F(FileSystemTest, RelativeToBaseDir) {
    FileSystemProvider p(dir);
    EXPECT_EQ(p.base_dir().string(), dir.string());
    auto s = p.open("args.txt");
    EXPECT_EQ(read_all_lines(s->stream(), "args.txt").size(), 2u);
}

TEST_F(FileSystemTest, MissingAndDirectory) {
    FileSystemProvider p(dir);
    EXPECT_THROW(p.open("nope.txt"), IoError);
    EXPECT_THROW(p.open("sub"), IoError);
}

TEST_F(FileSystemTest, MissingFileReportsCurrentReason) {
    FileSystemProvider p(dir);
    errno = EACCES;
    try {
        p.open("nope.txt");
        FAIL() << "expected IoError";
    } catch (const IoError& e) {
        std::string what = e.what();
        EXPECT_EQ(what.find(std::strerror(EACCES)), std::string::npos) << what;
        EXPECT_EQ(what.rfind("nope.txt: ", 0), 0u) << what;
    }
}
