#include "InMemoryBlobStore.hpp"
#include "blobxl/service/RequestHandler.hpp"
#include "blobxl/utils/Logger.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <stdexcept>
#include <string>

namespace blobxl {
namespace service {

class RequestHandlerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::getInstance().initialize("logs/request_handler_test.log", Logger::Level::DEBUG, false);
    }

    void TearDown() override {
        Logger::getInstance().shutdown();
    }

    RequestHandler makeHandler() {
        return RequestHandler(ServiceOptions(), [this](const storage::SecureString& connection_string) {
            ++factory_calls;
            last_connection_string = connection_string.str();
            if (connection_string.str() == "bad") {
                throw core::StorageException("Connection string is either blank or malformed.", 0,
                                             core::ErrorCode::InvalidConnectionString, __FILE__, __LINE__);
            }
            return std::unique_ptr<storage::IStorageContext>(
                std::make_unique<test::InMemoryStorageContext>(store));
        });
    }

    static std::string requestBody(const std::string& connection_string = "UseDevelopmentStorage=true",
                                   const std::string& container = "testcontainer") {
        return nlohmann::json{{"excel_filename", "report"},
                              {"container_name", container},
                              {"connection_string", connection_string}}.dump();
    }

    test::InMemoryBlobStore store;
    int factory_calls = 0;
    std::string last_connection_string;
};

// 缺少字段：400，不访问存储
TEST_F(RequestHandlerTest, MissingFieldsReturn400) {
    RequestHandler handler = makeHandler();
    for (const char* body : {"{}",
                             R"({"excel_filename":"r","container_name":"c"})",
                             R"({"excel_filename":"","container_name":"c","connection_string":"x"})",
                             R"({"excel_filename":5,"container_name":"c","connection_string":"x"})"}) {
        ServiceResponse response = handler.handle(body);
        EXPECT_EQ(response.status, 400) << body;
        EXPECT_EQ(response.content_type, "text/plain");
        EXPECT_EQ(response.body, RequestHandler::kMissingFieldsMessage);
    }
    EXPECT_EQ(factory_calls, 0);
}

// 请求体不是 JSON 对象：500
TEST_F(RequestHandlerTest, InvalidJsonReturns500) {
    RequestHandler handler = makeHandler();
    for (const char* body : {"", "not json", "[1,2]", "\"text\""}) {
        ServiceResponse response = handler.handle(body);
        EXPECT_EQ(response.status, 500) << body;
        EXPECT_EQ(response.content_type, "application/json");
        auto parsed = nlohmann::json::parse(response.body);
        EXPECT_EQ(parsed["status"], "error");
        EXPECT_EQ(parsed["message"], RequestHandler::kInvalidJsonMessage);
    }
    EXPECT_EQ(factory_calls, 0);
}

TEST_F(RequestHandlerTest, NoCsvFilesReturn404) {
    RequestHandler handler = makeHandler();
    ServiceResponse response = handler.handle(requestBody());
    EXPECT_EQ(response.status, 404);
    EXPECT_EQ(response.content_type, "text/plain");
    EXPECT_EQ(response.body, "No CSV files found in the csvfiles directory of the specified blob container.");
    EXPECT_EQ(factory_calls, 1);
}

// 测试成功响应
TEST_F(RequestHandlerTest, SuccessReturnsJson) {
    store.put("csvfiles/a.csv", "a\n1\n");
    store.put("csvfiles/b.csv", "b\n2\n");

    RequestHandler handler = makeHandler();
    ServiceResponse response = handler.handle(requestBody());
    ASSERT_EQ(response.status, 200) << response.body;
    EXPECT_EQ(response.content_type, "application/json");
    EXPECT_EQ(response.body,
              R"({"status":"success","message":"Job Complete!",)"
              R"("excel_url":"https://account.blob.core.windows.net/testcontainer/report.xlsx","file_count":2})");
    EXPECT_TRUE(store.has("report.xlsx"));
    EXPECT_EQ(last_connection_string, "UseDevelopmentStorage=true");
}

TEST_F(RequestHandlerTest, InvalidConnectionStringReturns500) {
    RequestHandler handler = makeHandler();
    ServiceResponse response = handler.handle(requestBody("bad"));
    EXPECT_EQ(response.status, 500);
    auto parsed = nlohmann::json::parse(response.body);
    EXPECT_EQ(parsed["status"], "error");
    EXPECT_EQ(parsed["message"], "Connection string is either blank or malformed.");
}

// 存储工厂抛出的非 blobxl 异常同样返回 500 JSON
TEST_F(RequestHandlerTest, UnexpectedFactoryExceptionReturns500) {
    RequestHandler handler(ServiceOptions(), [](const storage::SecureString&) -> std::unique_ptr<storage::IStorageContext> {
        throw std::runtime_error("transport unavailable");
    });
    ServiceResponse response = handler.handle(requestBody());
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(response.content_type, "application/json");
    auto parsed = nlohmann::json::parse(response.body);
    EXPECT_EQ(parsed["status"], "error");
    EXPECT_EQ(parsed["message"], "transport unavailable");
}

TEST_F(RequestHandlerTest, UnknownContainerReturns500) {
    RequestHandler handler = makeHandler();
    ServiceResponse response = handler.handle(requestBody("UseDevelopmentStorage=true", "missing"));
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(nlohmann::json::parse(response.body)["message"], "The specified container does not exist.");
}

TEST_F(RequestHandlerTest, UploadFailureReturns500) {
    store.put("csvfiles/a.csv", "a\n1\n");
    store.fail_upload = true;
    RequestHandler handler = makeHandler();
    ServiceResponse response = handler.handle(requestBody());
    EXPECT_EQ(response.status, 500);
    EXPECT_EQ(nlohmann::json::parse(response.body)["message"], "Upload rejected");
}

TEST(RequestParsingTest, ExtraFieldsIgnored) {
    auto params = RequestHandler::parseRequest(
        R"({"excel_filename":"r","container_name":"c","connection_string":"s","extra":1})");
    ASSERT_TRUE(params);
    EXPECT_EQ(params->excel_filename, "r");
    EXPECT_EQ(params->container_name, "c");
    EXPECT_EQ(params->connection_string.str(), "s");
}

TEST(ResponseMappingTest, ErrorCodes) {
    EXPECT_EQ(RequestHandler::errorResponse(core::makeError(core::ErrorCode::ValidationFailed, "v")).status, 400);
    EXPECT_EQ(RequestHandler::errorResponse(core::makeError(core::ErrorCode::NotFound, "n")).status, 404);
    EXPECT_EQ(RequestHandler::errorResponse(core::makeError(core::ErrorCode::CsvParseError, "p")).status, 500);
    EXPECT_EQ(RequestHandler::errorResponse(core::makeError(core::ErrorCode::StorageAccess, "s")).status, 500);
}

}} // namespace blobxl::service
