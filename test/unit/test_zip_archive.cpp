#include "blobxl/archive/ZipReader.hpp"
#include "blobxl/archive/ZipWriter.hpp"
#include "blobxl/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

namespace blobxl {
namespace archive {

class ZipArchiveTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/zip_test.log", Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    // 写出一个包含给定条目的归档
    static std::vector<uint8_t> buildArchive(int level) {
        ZipWriter writer;
        EXPECT_EQ(writer.setCompressionLevel(level), ZipError::Ok);
        EXPECT_TRUE(writer.open());
        EXPECT_EQ(writer.addFile("[Content_Types].xml", "<Types/>"), ZipError::Ok);
        EXPECT_EQ(writer.addFile("xl/worksheets/sheet1.xml", std::string(10000, 'x')), ZipError::Ok);
        EXPECT_TRUE(writer.hasEntry("xl/worksheets/sheet1.xml"));
        EXPECT_EQ(writer.getStats().entries_written, 2u);
        EXPECT_TRUE(writer.close());
        return writer.takeBuffer();
    }
};

// 测试写入后读回
TEST_F(ZipArchiveTest, WriteThenRead) {
    const std::vector<uint8_t> archive = buildArchive(6);
    ASSERT_FALSE(archive.empty());
    EXPECT_EQ(archive[0], 'P');
    EXPECT_EQ(archive[1], 'K');

    ZipReader reader;
    ASSERT_TRUE(reader.open(archive));
    const auto files = reader.listFiles();
    ASSERT_EQ(files.size(), 2u);
    EXPECT_EQ(files[0], "[Content_Types].xml");
    EXPECT_EQ(files[1], "xl/worksheets/sheet1.xml");

    std::string content;
    ASSERT_EQ(reader.extractFile("xl/worksheets/sheet1.xml", content), ZipError::Ok);
    EXPECT_EQ(content, std::string(10000, 'x'));

    ZipReader::EntryInfo info;
    ASSERT_TRUE(reader.getEntryInfo("xl/worksheets/sheet1.xml", info));
    EXPECT_EQ(info.uncompressed_size, 10000u);
    EXPECT_LT(info.compressed_size, info.uncompressed_size);
}

TEST_F(ZipArchiveTest, StoredEntries) {
    const std::vector<uint8_t> archive = buildArchive(0);
    ZipReader reader;
    ASSERT_TRUE(reader.open(archive));
    ZipReader::EntryInfo info;
    ASSERT_TRUE(reader.getEntryInfo("[Content_Types].xml", info));
    EXPECT_EQ(info.compressed_size, info.uncompressed_size);

    std::vector<uint8_t> bytes;
    ASSERT_EQ(reader.extractFile("[Content_Types].xml", bytes), ZipError::Ok);
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), "<Types/>");
}

TEST_F(ZipArchiveTest, MissingEntry) {
    ZipReader reader;
    EXPECT_EQ(reader.fileExists("a"), ZipError::NotOpen);
    ASSERT_TRUE(reader.open(buildArchive(6)));
    EXPECT_EQ(reader.fileExists("[Content_Types].xml"), ZipError::Ok);
    EXPECT_EQ(reader.fileExists("nope.xml"), ZipError::FileNotFound);
    std::string content;
    EXPECT_EQ(reader.extractFile("nope.xml", content), ZipError::FileNotFound);
}

// 重复路径只写入一次
TEST_F(ZipArchiveTest, DuplicateEntryIgnored) {
    ZipWriter writer;
    ASSERT_TRUE(writer.open());
    EXPECT_EQ(writer.addFile("a.txt", "first"), ZipError::Ok);
    EXPECT_EQ(writer.addFile("a.txt", "second"), ZipError::Ok);
    EXPECT_EQ(writer.getStats().entries_written, 1u);
    ASSERT_TRUE(writer.close());

    ZipReader reader;
    ASSERT_TRUE(reader.open(writer.takeBuffer()));
    std::string content;
    ASSERT_EQ(reader.extractFile("a.txt", content), ZipError::Ok);
    EXPECT_EQ(content, "first");
}

TEST_F(ZipArchiveTest, InvalidUsage) {
    ZipWriter writer;
    EXPECT_EQ(writer.addFile("a.txt", "x"), ZipError::NotOpen);
    EXPECT_EQ(writer.setCompressionLevel(10), ZipError::InvalidParameter);
    ASSERT_TRUE(writer.open());
    EXPECT_EQ(writer.addFile("", "x"), ZipError::InvalidParameter);

    ZipReader reader;
    EXPECT_FALSE(reader.open({}));
    EXPECT_FALSE(reader.open({'n', 'o', 't', 'z', 'i', 'p'}));
}

}} // namespace blobxl::archive
