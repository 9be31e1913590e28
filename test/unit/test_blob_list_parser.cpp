#include "blobxl/core/Exception.hpp"
#include "blobxl/storage/BlobListParser.hpp"
#include "blobxl/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <string>

namespace blobxl {
namespace storage {

class BlobListParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/blob_list_test.log", Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }
};

// 测试解析一页 List Blobs 响应
TEST_F(BlobListParserTest, ParsesPage) {
    const std::string xml =
        "\xEF\xBB\xBF<?xml version=\"1.0\" encoding=\"utf-8\"?>"
        "<EnumerationResults ServiceEndpoint=\"https://acct.blob.core.windows.net/\" ContainerName=\"data\">"
        "<Prefix>csvfiles/</Prefix>"
        "<Blobs>"
        "<Blob><Name>csvfiles/a.csv</Name><Properties><Content-Length>12</Content-Length></Properties></Blob>"
        "<Blob><Name>csvfiles/sub/b &amp; c.csv</Name><Properties><Content-Length>0</Content-Length></Properties></Blob>"
        "</Blobs>"
        "<NextMarker>2!72!MDAwMDE</NextMarker>"
        "</EnumerationResults>";

    BlobListPage page = BlobListParser::parse(xml);
    ASSERT_EQ(page.blobs.size(), 2u);
    EXPECT_EQ(page.blobs[0].name, "csvfiles/a.csv");
    EXPECT_EQ(page.blobs[0].content_length, 12u);
    EXPECT_EQ(page.blobs[1].name, "csvfiles/sub/b & c.csv");
    EXPECT_EQ(page.next_marker, "2!72!MDAwMDE");
}

TEST_F(BlobListParserTest, LastPageHasEmptyMarker) {
    BlobListPage page = BlobListParser::parse(
        "<EnumerationResults><Blobs/><NextMarker/></EnumerationResults>");
    EXPECT_TRUE(page.blobs.empty());
    EXPECT_TRUE(page.next_marker.empty());
}

TEST_F(BlobListParserTest, RejectsUnexpectedDocuments) {
    EXPECT_THROW(BlobListParser::parse("<Error><Code>AuthenticationFailed</Code></Error>"), core::StorageException);
    EXPECT_THROW(BlobListParser::parse("not xml"), core::StorageException);
    EXPECT_THROW(BlobListParser::parse(""), core::StorageException);
}

// 测试错误响应解析
TEST_F(BlobListParserTest, ParsesErrorBody) {
    std::string code;
    std::string message;
    ASSERT_TRUE(BlobListParser::parseError(
        "<?xml version=\"1.0\" encoding=\"utf-8\"?><Error><Code>ContainerNotFound</Code>"
        "<Message>The specified container does not exist.\nRequestId:abc</Message></Error>",
        code, message));
    EXPECT_EQ(code, "ContainerNotFound");
    EXPECT_EQ(message, "The specified container does not exist.\nRequestId:abc");

    EXPECT_FALSE(BlobListParser::parseError("", code, message));
    EXPECT_FALSE(BlobListParser::parseError("<EnumerationResults/>", code, message));
}

}} // namespace blobxl::storage
