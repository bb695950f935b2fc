#include <gtest/gtest.h>
#include "file_ops.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

class FileOpsTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string tmpl = (fs::temp_directory_path() / "executor-files-XXXXXX").string();
        ASSERT_NE(::mkdtemp(tmpl.data()), nullptr);
        dir = fs::canonical(tmpl);
    }
    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }
    void write_file(const fs::path& p, const std::string& content) {
        std::ofstream(p, std::ios::binary) << content;
    }
    static std::string read_file(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
    fs::path dir;
};

TEST_F(FileOpsTest, BrowseListsSortedEntries) {
    write_file(dir / "b.txt", "12345");
    fs::create_directory(dir / "a_dir");
    write_file(dir / "c.bin", "");
    auto r = browse_directory(dir);
    EXPECT_EQ(r.path, dir);
    ASSERT_EQ(r.entries.size(), 3u);
    EXPECT_EQ(r.entries[0].name, "a_dir");
    EXPECT_EQ(r.entries[0].type, "dir");
    EXPECT_FALSE(r.entries[0].size.has_value());
    EXPECT_EQ(r.entries[1].name, "b.txt");
    EXPECT_EQ(r.entries[1].type, "file");
    EXPECT_EQ(*r.entries[1].size, 5u);
    EXPECT_EQ(*r.entries[2].size, 0u);
}

TEST_F(FileOpsTest, BrowseErrors) {
    write_file(dir / "plain", "x");
    try {
        browse_directory(dir / "missing");
        FAIL() << "expected FileOpError";
    } catch (const FileOpError& e) {
        EXPECT_EQ(e.code(), FileErrorCode::NotFound);
    }
    try {
        browse_directory(dir / "plain");
        FAIL() << "expected FileOpError";
    } catch (const FileOpError& e) {
        EXPECT_EQ(e.code(), FileErrorCode::NotADirectory);
    }
}

TEST_F(FileOpsTest, ListFilesSkipsDirectories) {
    write_file(dir / "z.png", "zz");
    write_file(dir / "a.png", "a");
    fs::create_directory(dir / "sub");
    auto files = list_files(dir);
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0].name, "a.png");
    EXPECT_EQ(files[0].size, 1u);
    EXPECT_EQ(files[1].name, "z.png");
    EXPECT_TRUE(list_files(dir / "does-not-exist").empty());
}

TEST_F(FileOpsTest, ResolveDownload) {
    fs::create_directory(dir / "out");
    write_file(dir / "out" / "image.png", "png");
    write_file(dir / "secret", "s");
    EXPECT_EQ(resolve_download(dir / "out", "image.png"), dir / "out" / "image.png");
    try {
        resolve_download(dir / "out", "../secret");
        FAIL() << "expected FileOpError";
    } catch (const FileOpError& e) {
        EXPECT_EQ(e.code(), FileErrorCode::InvalidPath);
    }
    try {
        resolve_download(dir / "out", "nothing.png");
        FAIL() << "expected FileOpError";
    } catch (const FileOpError& e) {
        EXPECT_EQ(e.code(), FileErrorCode::NotFound);
    }
}

TEST_F(FileOpsTest, UploadCommitUsesBaseName) {
    fs::path target;
    {
        UploadSink sink;
        sink.write("abc", 3);
        sink.write("def", 3);
        EXPECT_EQ(sink.bytes_written(), 6u);
        target = sink.commit(dir / "nested", "../escape.txt");
    }
    EXPECT_EQ(target, dir / "nested" / "escape.txt");
    EXPECT_EQ(read_file(target), "abcdef");
    EXPECT_FALSE(fs::exists(dir / "escape.txt"));
}

TEST_F(FileOpsTest, UploadRejectsEmptyName) {
    UploadSink sink;
    sink.write("x", 1);
    EXPECT_THROW(sink.commit(dir, ""), FileOpError);
}

TEST(FileOps, DiskUsageOfRoot) {
    auto d = disk_usage("/");
    EXPECT_GE(d.total_gb, 0.0);
    EXPECT_LE(d.used_gb, d.total_gb + 0.01);
    EXPECT_LE(d.free_gb, d.total_gb + 0.01);
}
