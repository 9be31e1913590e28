#include "blobxl/core/ErrorCode.hpp"

namespace blobxl {
namespace core {

Error::Error(ErrorCode c) : code(c), message(toString(c)) {}

const char* toString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Ok:
            return "Success";

        // 通用错误
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InternalError:
            return "Internal error";

        // 请求与输入
        case ErrorCode::ValidationFailed:
            return "Validation failed";
        case ErrorCode::NotFound:
            return "Not found";

        // 存储访问
        case ErrorCode::StorageAccess:
            return "Storage access error";
        case ErrorCode::InvalidConnectionString:
            return "Invalid connection string";
        case ErrorCode::FileReadError:
            return "File read error";
        case ErrorCode::FileWriteError:
            return "File write error";

        // 数据解析与序列化
        case ErrorCode::CsvParseError:
            return "CSV parse error";
        case ErrorCode::InvalidWorksheet:
            return "Invalid worksheet";
        case ErrorCode::SerializationFailed:
            return "Serialization failed";
        case ErrorCode::ZipError:
            return "ZIP error";
        case ErrorCode::XmlParseError:
            return "XML parse error";
        case ErrorCode::XmlInvalidFormat:
            return "Invalid XML format";

        default:
            return "Unknown error";
    }
}

}} // namespace blobxl::core
