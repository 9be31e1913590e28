/**
 * @file Exception.hpp
 * @brief blobxl 异常类定义
 *
 * 各模块内部以异常报告失败，服务边界统一转换为 core::Error。
 */

#ifndef BLOBXL_EXCEPTION_HPP
#define BLOBXL_EXCEPTION_HPP

#include <stdexcept>
#include <string>
#include <vector>
#include "ErrorCode.hpp"

namespace blobxl {
namespace core {

/**
 * @brief 基础异常类
 */
class BlobxlException : public std::runtime_error {
public:
    /**
     * @brief 构造函数
     * @param message 错误消息
     * @param code 错误代码
     * @param file 发生错误的文件名
     * @param line 发生错误的行号
     */
    BlobxlException(const std::string& message,
                    ErrorCode code = ErrorCode::InternalError,
                    const char* file = nullptr,
                    int line = 0);

    ErrorCode getErrorCode() const noexcept { return error_code_; }

    std::string getErrorCodeString() const { return toString(error_code_); }

    /**
     * @brief 获取详细错误信息（含错误码、源码位置与上下文）
     */
    std::string getDetailedMessage() const;

    const char* getFile() const noexcept { return file_; }
    int getLine() const noexcept { return line_; }

    void addContext(const std::string& context);
    const std::vector<std::string>& getContext() const { return context_; }

    /**
     * @brief 转换为错误值
     */
    Error toError() const;

private:
    ErrorCode error_code_;
    const char* file_;
    int line_;
    std::vector<std::string> context_;
};

/**
 * @brief 请求参数校验失败
 */
class ValidationException : public BlobxlException {
public:
    ValidationException(const std::string& message,
                        const std::string& parameter_name = "",
                        const char* file = nullptr, int line = 0);

    const std::string& getParameterName() const { return parameter_name_; }

private:
    std::string parameter_name_;
};

/**
 * @brief 没有找到任何输入对象
 */
class NotFoundException : public BlobxlException {
public:
    NotFoundException(const std::string& message,
                      const char* file = nullptr, int line = 0);
};

/**
 * @brief 存储访问失败（连接、认证、HTTP 错误、本地文件 I/O）
 */
class StorageException : public BlobxlException {
public:
    StorageException(const std::string& message,
                     int http_status = 0,
                     ErrorCode code = ErrorCode::StorageAccess,
                     const char* file = nullptr, int line = 0);

    int getHttpStatus() const { return http_status_; }

private:
    int http_status_;
};

/**
 * @brief CSV 内容解析失败
 */
class ParseException : public BlobxlException {
public:
    ParseException(const std::string& message,
                   const std::string& source_name = "",
                   const char* file = nullptr, int line = 0);

    const std::string& getSourceName() const { return source_name_; }

private:
    std::string source_name_;
};

/**
 * @brief 工作簿序列化失败
 */
class SerializationException : public BlobxlException {
public:
    SerializationException(const std::string& message,
                           const std::string& worksheet_name = "",
                           ErrorCode code = ErrorCode::SerializationFailed,
                           const char* file = nullptr, int line = 0);

    const std::string& getWorksheetName() const { return worksheet_name_; }

private:
    std::string worksheet_name_;
};

/**
 * @brief XML 生成或解析异常
 */
class XMLException : public BlobxlException {
public:
    XMLException(const std::string& message,
                 const std::string& xml_path = "",
                 int xml_line = -1,
                 const char* file = nullptr, int line = 0);

    const std::string& getXMLPath() const { return xml_path_; }
    int getXMLLine() const { return xml_line_; }

private:
    std::string xml_path_;
    int xml_line_;
};

} // namespace core
} // namespace blobxl

// 便捷宏定义
#define BLOBXL_THROW(ExceptionType, message) \
    throw ExceptionType(message, __FILE__, __LINE__)

#define BLOBXL_THROW_IF(condition, ExceptionType, message) \
    do { if (condition) { BLOBXL_THROW(ExceptionType, message); } } while(0)

#endif // BLOBXL_EXCEPTION_HPP
