#pragma once

#include "blobxl/core/Expected.hpp"
#include "blobxl/service/ConversionService.hpp"
#include "blobxl/storage/IBlobStore.hpp"
#include "blobxl/storage/SecureString.hpp"
#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace blobxl {
namespace service {

/**
 * @brief 请求参数；connection_string 为机密，不得写入日志
 */
struct RequestParameters {
    std::string excel_filename;
    std::string container_name;
    storage::SecureString connection_string;
};

struct ServiceResponse {
    int status = 200;
    std::string content_type;
    std::string body;
};

/**
 * @brief ConvertCsvToExcel 入口：JSON 请求体 -> 状态码 / 内容类型 / 响应体
 *
 * | 条件           | 状态 | 内容类型          |
 * | 缺少字段       | 400  | text/plain        |
 * | 无 CSV 对象    | 404  | text/plain        |
 * | 成功           | 200  | application/json  |
 * | 其他失败       | 500  | application/json  |
 */
class RequestHandler {
public:
    using ContextFactory =
        std::function<std::unique_ptr<storage::IStorageContext>(const storage::SecureString& connection_string)>;

    static constexpr const char* kMissingFieldsMessage =
        "Please provide excel_filename, container_name, and connection_string in the request body.";
    static constexpr const char* kInvalidJsonMessage = "HTTP request does not contain valid JSON data";

    /**
     * @param factory 为空时使用 Azure 存储上下文
     */
    explicit RequestHandler(ServiceOptions options = ServiceOptions(), ContextFactory factory = nullptr);

    ServiceResponse handle(std::string_view body);

    /**
     * @brief 解析并校验请求体，不做任何 I/O
     */
    static core::Result<RequestParameters> parseRequest(std::string_view body);

    /**
     * @brief 按错误码映射响应
     */
    static ServiceResponse errorResponse(const core::Error& error);

    static ServiceResponse successResponse(const ConversionResult& result);

private:
    ConversionService service_;
    ContextFactory factory_;
};

}} // namespace blobxl::service
