#pragma once

#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace blobxl {
namespace storage {

/**
 * @brief 一次 HTTP 请求
 *
 * query 中保存未编码的参数值，由 buildUrl() 统一编码；
 * raw_query 为已编码的附加查询串（SAS 令牌），原样追加。
 */
struct HttpRequest {
    std::string method = "GET";
    std::string url;                                  // scheme://host[:port]/path，不含查询串
    std::map<std::string, std::string> query;
    std::string raw_query;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string_view body;                            // 不持有数据

    void setHeader(const std::string& name, const std::string& value);

    /**
     * @brief 按名称（大小写不敏感）查找请求头
     * @return 不存在时返回空串
     */
    std::string header(std::string_view name) const;
};

struct HttpResponse {
    long status = 0;
    std::string body;
    std::map<std::string, std::string> headers;       // 名称统一为小写

    bool isSuccess() const { return status >= 200 && status < 300; }

    std::string header(const std::string& lower_name) const {
        auto it = headers.find(lower_name);
        return it == headers.end() ? std::string() : it->second;
    }
};

/**
 * @brief HTTP 传输接口
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @brief 执行请求
     * @throws StorageException 连接失败等传输层错误（HTTP 错误状态不抛出）
     */
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

struct HttpOptions {
    long connect_timeout_seconds = 0;   // 0 = 不限制
    long timeout_seconds = 0;           // 0 = 不限制
    bool verify_tls = true;
    std::string user_agent = "blobxl/1.0 (libcurl)";
};

/**
 * @brief 基于 libcurl easy 接口的传输实现
 *
 * curl_global_init 由进程入口调用一次。
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(HttpOptions options = HttpOptions());

    HttpResponse perform(const HttpRequest& request) override;

private:
    HttpOptions options_;
};

/**
 * @brief URL 百分号编码（RFC 3986 非保留字符原样保留）
 * @param keep_slash 为 true 时保留 '/'（用于路径）
 */
std::string urlEncode(std::string_view text, bool keep_slash = false);

/**
 * @brief 交给 libcurl 的请求头行
 *
 * 带请求体且未设置 Content-Type 时追加空的 "Content-Type:"，
 * 阻止 libcurl 自动补上 application/x-www-form-urlencoded（签名中该项为空）。
 * 末尾追加 "Expect:" 禁用 100-continue。
 */
std::vector<std::string> curlHeaderLines(const HttpRequest& request);

/**
 * @brief 拼接完整 URL：url + 编码后的 query + raw_query
 */
std::string buildUrl(const HttpRequest& request);

/**
 * @brief 取 URL 的路径部分（含开头 '/'；无路径时返回 "/"）
 */
std::string urlPath(const std::string& url);

}} // namespace blobxl::storage
