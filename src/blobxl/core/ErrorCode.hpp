#pragma once

#include <cstdint>
#include <string>
#include <fmt/format.h>

namespace blobxl {
namespace core {

/**
 * @brief 统一错误码
 *
 * 按请求处理阶段分组，服务边界根据错误码决定 HTTP 状态。
 */
enum class ErrorCode : uint8_t {
    // 成功
    Ok = 0,

    // 通用错误 (1-19)
    InvalidArgument = 1,
    InternalError = 3,

    // 请求与输入 (20-39)
    ValidationFailed = 20,
    NotFound = 21,

    // 存储访问 (40-59)
    StorageAccess = 40,
    InvalidConnectionString = 41,
    FileReadError = 42,
    FileWriteError = 43,

    // 数据解析与序列化 (60-79)
    CsvParseError = 60,
    InvalidWorksheet = 61,
    SerializationFailed = 62,
    ZipError = 63,
    XmlParseError = 64,
    XmlInvalidFormat = 65
};

/**
 * @brief 错误信息结构
 */
struct Error {
    ErrorCode code;
    std::string message;
    std::string context;  // 额外上下文信息

    Error() : code(ErrorCode::Ok) {}

    explicit Error(ErrorCode c);

    Error(ErrorCode c, const std::string& msg) : code(c), message(msg) {}

    Error(ErrorCode c, const std::string& msg, const std::string& ctx)
        : code(c), message(msg), context(ctx) {}

    bool isOk() const noexcept { return code == ErrorCode::Ok; }
    bool isError() const noexcept { return code != ErrorCode::Ok; }

    std::string fullMessage() const {
        if (context.empty()) {
            return message;
        }
        return fmt::format("{} (Context: {})", message, context);
    }
};

/**
 * @brief 错误码转字符串
 */
const char* toString(ErrorCode code) noexcept;

inline Error makeError(ErrorCode code, const std::string& message) {
    return Error(code, message);
}

inline Error makeError(ErrorCode code, const std::string& message, const std::string& context) {
    return Error(code, message, context);
}

}} // namespace blobxl::core
