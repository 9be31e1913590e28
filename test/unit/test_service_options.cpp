#include "blobxl/service/ServiceOptions.hpp"
#include "blobxl/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <map>
#include <string>

namespace blobxl {
namespace service {

class ServiceOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/service_options_test.log", Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    ServiceOptions fromMap(const std::map<std::string, std::string>& values) {
        return ServiceOptions::fromLookup([&values](const char* name) -> const char* {
            auto it = values.find(name);
            return it == values.end() ? nullptr : it->second.c_str();
        });
    }
};

TEST_F(ServiceOptionsTest, Defaults) {
    ServiceOptions options = fromMap({});
    EXPECT_EQ(options.source_prefix, "csvfiles/");
    EXPECT_EQ(options.source_extension, ".csv");
    EXPECT_EQ(options.compression_level, 6);
    EXPECT_EQ(options.log_level, Logger::Level::INFO);
    EXPECT_EQ(options.storage.api_version, "2020-10-02");
    EXPECT_EQ(options.storage.single_put_limit, 64u * 1024 * 1024);
    EXPECT_TRUE(options.storage.http.verify_tls);
}

// 测试从环境变量覆盖
TEST_F(ServiceOptionsTest, OverridesFromLookup) {
    ServiceOptions options = fromMap({
        {"BLOBXL_LOG_LEVEL", "debug"},
        {"BLOBXL_LOG_CONSOLE", "off"},
        {"BLOBXL_SOURCE_PREFIX", "input/"},
        {"BLOBXL_COMPRESSION_LEVEL", "9"},
        {"BLOBXL_BLOCK_SIZE", "1048576"},
        {"BLOBXL_TIMEOUT", "30"},
        {"BLOBXL_VERIFY_TLS", "no"},
    });
    EXPECT_EQ(options.log_level, Logger::Level::DEBUG);
    EXPECT_FALSE(options.log_to_console);
    EXPECT_EQ(options.source_prefix, "input/");
    EXPECT_EQ(options.compression_level, 9);
    EXPECT_EQ(options.storage.block_size, 1048576u);
    EXPECT_EQ(options.storage.http.timeout_seconds, 30);
    EXPECT_FALSE(options.storage.http.verify_tls);
}

// 无效值保留默认
TEST_F(ServiceOptionsTest, InvalidValuesKeepDefaults) {
    ServiceOptions options;
    EXPECT_FALSE(options.apply("BLOBXL_COMPRESSION_LEVEL", "10"));
    EXPECT_FALSE(options.apply("BLOBXL_COMPRESSION_LEVEL", "abc"));
    EXPECT_FALSE(options.apply("BLOBXL_SINGLE_PUT_LIMIT", "0"));
    EXPECT_FALSE(options.apply("BLOBXL_BLOCK_SIZE", "99999999999"));
    EXPECT_FALSE(options.apply("BLOBXL_TIMEOUT", "-1"));
    EXPECT_FALSE(options.apply("BLOBXL_VERIFY_TLS", "maybe"));
    EXPECT_FALSE(options.apply("BLOBXL_LOG_LEVEL", "loud"));
    EXPECT_FALSE(options.apply("BLOBXL_SOURCE_EXTENSION", ""));
    EXPECT_FALSE(options.apply("BLOBXL_UNKNOWN", "1"));

    EXPECT_EQ(options.compression_level, 6);
    EXPECT_EQ(options.storage.block_size, 4u * 1024 * 1024);
    EXPECT_EQ(options.storage.http.timeout_seconds, 0);
    EXPECT_TRUE(options.storage.http.verify_tls);
    EXPECT_EQ(options.source_extension, ".csv");
}

TEST_F(ServiceOptionsTest, ApplyAcceptsValidValues) {
    ServiceOptions options;
    EXPECT_TRUE(options.apply("BLOBXL_API_VERSION", "2021-08-06"));
    EXPECT_TRUE(options.apply("BLOBXL_SINGLE_PUT_LIMIT", "1024"));
    EXPECT_TRUE(options.apply("BLOBXL_LOG_FILE", "other.log"));
    EXPECT_EQ(options.storage.api_version, "2021-08-06");
    EXPECT_EQ(options.storage.single_put_limit, 1024u);
    EXPECT_EQ(options.log_file, "other.log");
}

TEST(LoggerLevelTest, ParseLevelNames) {
    Logger::Level level = Logger::Level::INFO;
    EXPECT_TRUE(Logger::parseLevel("WARNING", level));
    EXPECT_EQ(level, Logger::Level::WARN);
    EXPECT_TRUE(Logger::parseLevel("off", level));
    EXPECT_EQ(level, Logger::Level::OFF);
    EXPECT_TRUE(Logger::parseLevel("Trace", level));
    EXPECT_EQ(level, Logger::Level::TRACE);
    EXPECT_FALSE(Logger::parseLevel("verbose", level));
}

}} // namespace blobxl::service
