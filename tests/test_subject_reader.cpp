/*
 * Unit tests for subject_reader
 */

#include "subject_reader.hpp"

#include <gtest/gtest.h>
#include <zlib.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>

namespace fs = std::filesystem;
using namespace rexbind::subject_reader;

class SubjectReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir = fs::temp_directory_path() / ("rexbind-subject-" + std::to_string(rd()));
        fs::create_directories(dir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string write_file(const std::string& name, const std::string& content) {
        std::string p = (dir / name).string();
        std::ofstream ofs(p, std::ios::binary);
        ofs.write(content.data(), static_cast<std::streamsize>(content.size()));
        return p;
    }

    fs::path dir;
};

TEST_F(SubjectReaderTest, PlainFile)
{
    std::string content("line one\nline\0two\n", 18);
    auto p = write_file("plain.txt", content);
    EXPECT_EQ(read_subject(p), content);
}

TEST_F(SubjectReaderTest, GzipFileWrittenByZlib)
{
    std::string content = "2024-06 report\n2024-07 report\n";
    std::string p = (dir / "log.gz").string();
    gzFile gz = gzopen(p.c_str(), "wb");
    ASSERT_NE(gz, nullptr);
    ASSERT_EQ(gzwrite(gz, content.data(), static_cast<unsigned>(content.size())),
              static_cast<int>(content.size()));
    ASSERT_EQ(gzclose(gz), Z_OK);

    EXPECT_EQ(read_subject(p), content);
}

TEST_F(SubjectReaderTest, DeflateInflate)
{
    std::string content(100000, 'x');
    content += "tail";
    auto compressed = deflate_gzip(content);
    EXPECT_TRUE(is_gzip(compressed));
    EXPECT_LT(compressed.size(), content.size());
    EXPECT_EQ(inflate_gzip(compressed), content);

    auto p = write_file("big.gz", compressed);
    EXPECT_EQ(read_subject(p), content);
}

TEST_F(SubjectReaderTest, CorruptGzip)
{
    auto compressed = deflate_gzip("some text that will be damaged");
    compressed.resize(compressed.size() / 2);
    EXPECT_THROW(inflate_gzip(compressed), subject_error);

    std::string garbage = "\x1f\x8b garbage";
    EXPECT_THROW(inflate_gzip(garbage), subject_error);
}

TEST_F(SubjectReaderTest, MissingFile)
{
    EXPECT_THROW(read_subject((dir / "nope.txt").string()), subject_error);
}

TEST_F(SubjectReaderTest, IsGzip)
{
    EXPECT_FALSE(is_gzip(""));
    EXPECT_FALSE(is_gzip("\x1f"));
    EXPECT_TRUE(is_gzip("\x1f\x8b"));
    EXPECT_FALSE(is_gzip("plain"));
}
