#include "blobxl/core/Exception.hpp"
#include "blobxl/storage/ConnectionString.hpp"
#include "blobxl/storage/SecureString.hpp"
#include "blobxl/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <string>

namespace blobxl {
namespace storage {

class ConnectionStringTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/connection_string_test.log", Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    static void expectMalformed(const std::string& text) {
        try {
            ConnectionString::parse(text);
            ADD_FAILURE() << "accepted: " << text;
        } catch (const core::StorageException& e) {
            EXPECT_EQ(e.getErrorCode(), core::ErrorCode::InvalidConnectionString);
            EXPECT_STREQ(e.what(), ConnectionString::kMalformedMessage);
        }
    }
};

// 测试标准账户连接字符串
TEST_F(ConnectionStringTest, AccountKeyConnectionString) {
    auto cs = ConnectionString::parse(
        "DefaultEndpointsProtocol=https;AccountName=myaccount;AccountKey=a2V5a2V5a2V5a2V5;EndpointSuffix=core.windows.net");
    EXPECT_EQ(cs.accountName(), "myaccount");
    EXPECT_EQ(cs.accountKey().str(), "a2V5a2V5a2V5a2V5");
    EXPECT_EQ(cs.blobEndpoint(), "https://myaccount.blob.core.windows.net");
    EXPECT_TRUE(cs.hasSharedKey());
    EXPECT_FALSE(cs.hasSasToken());
    EXPECT_FALSE(cs.isDevelopmentStorage());
}

// 键名大小写不敏感，值中的 '=' 保留
TEST_F(ConnectionStringTest, KeysAreCaseInsensitive) {
    auto cs = ConnectionString::parse(" accountname = acct ; ACCOUNTKEY=abcd== ;endpointsuffix=core.chinacloudapi.cn;");
    EXPECT_EQ(cs.accountName(), "acct");
    EXPECT_EQ(cs.accountKey().str(), "abcd==");
    EXPECT_EQ(cs.blobEndpoint(), "https://acct.blob.core.chinacloudapi.cn");
}

TEST_F(ConnectionStringTest, DefaultsAndProtocol) {
    auto cs = ConnectionString::parse("DefaultEndpointsProtocol=http;AccountName=a;AccountKey=a2V5");
    EXPECT_EQ(cs.blobEndpoint(), "http://a.blob.core.windows.net");
}

// 显式 BlobEndpoint 与 SAS 令牌
TEST_F(ConnectionStringTest, BlobEndpointWithSas) {
    auto cs = ConnectionString::parse(
        "BlobEndpoint=https://custom.example.com/;SharedAccessSignature=?sv=2020-10-02&sig=abc%3D");
    EXPECT_EQ(cs.blobEndpoint(), "https://custom.example.com");
    EXPECT_TRUE(cs.hasSasToken());
    EXPECT_FALSE(cs.hasSharedKey());
    EXPECT_EQ(cs.sasToken().str(), "sv=2020-10-02&sig=abc%3D");
    EXPECT_TRUE(cs.accountName().empty());
}

TEST_F(ConnectionStringTest, DevelopmentStorage) {
    auto cs = ConnectionString::parse("UseDevelopmentStorage=true");
    EXPECT_TRUE(cs.isDevelopmentStorage());
    EXPECT_EQ(cs.accountName(), "devstoreaccount1");
    EXPECT_EQ(cs.blobEndpoint(), "http://127.0.0.1:10000/devstoreaccount1");
    EXPECT_TRUE(cs.hasSharedKey());
    EXPECT_EQ(cs.accountKey().size(), 88u);
}

// 测试格式错误的连接字符串
TEST_F(ConnectionStringTest, MalformedStrings) {
    expectMalformed("");
    expectMalformed("   ");
    expectMalformed("not a connection string");
    expectMalformed("=value;AccountName=a;AccountKey=a2V5");
    expectMalformed("AccountKey=a2V5");
    expectMalformed("AccountName=a");
    expectMalformed("BlobEndpoint=https://x.example.com;AccountKey=a2V5");
}

// SecureString 移动后源对象为空
TEST(SecureStringTest, MoveLeavesSourceEmpty) {
    SecureString a(std::string("secret"));
    SecureString b(std::move(a));
    EXPECT_EQ(b.str(), "secret");
    EXPECT_TRUE(a.empty());
    b.clear();
    EXPECT_TRUE(b.empty());
}

}} // namespace blobxl::storage
