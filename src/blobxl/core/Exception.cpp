/**
 * @file Exception.cpp
 * @brief blobxl 异常类实现
 */

#include "blobxl/core/Exception.hpp"
#include <sstream>

namespace blobxl {
namespace core {

BlobxlException::BlobxlException(const std::string& message,
                                 ErrorCode code,
                                 const char* file,
                                 int line)
    : std::runtime_error(message)
    , error_code_(code)
    , file_(file)
    , line_(line) {
}

std::string BlobxlException::getDetailedMessage() const {
    std::ostringstream oss;
    oss << "[" << getErrorCodeString() << "] " << what();

    if (file_ && line_ > 0) {
        oss << " (at " << file_ << ":" << line_ << ")";
    }

    if (!context_.empty()) {
        oss << "\nContext:";
        for (const auto& ctx : context_) {
            oss << "\n  - " << ctx;
        }
    }

    return oss.str();
}

void BlobxlException::addContext(const std::string& context) {
    context_.push_back(context);
}

Error BlobxlException::toError() const {
    std::string ctx;
    for (const auto& c : context_) {
        if (!ctx.empty()) ctx += "; ";
        ctx += c;
    }
    return Error(error_code_, what(), ctx);
}

// ValidationException 实现
ValidationException::ValidationException(const std::string& message,
                                         const std::string& parameter_name,
                                         const char* file, int line)
    : BlobxlException(message, ErrorCode::ValidationFailed, file, line)
    , parameter_name_(parameter_name) {
}

// NotFoundException 实现
NotFoundException::NotFoundException(const std::string& message,
                                     const char* file, int line)
    : BlobxlException(message, ErrorCode::NotFound, file, line) {
}

// StorageException 实现
StorageException::StorageException(const std::string& message,
                                   int http_status,
                                   ErrorCode code,
                                   const char* file, int line)
    : BlobxlException(message, code, file, line)
    , http_status_(http_status) {
}

// ParseException 实现
ParseException::ParseException(const std::string& message,
                               const std::string& source_name,
                               const char* file, int line)
    : BlobxlException(message, ErrorCode::CsvParseError, file, line)
    , source_name_(source_name) {
}

// SerializationException 实现
SerializationException::SerializationException(const std::string& message,
                                               const std::string& worksheet_name,
                                               ErrorCode code,
                                               const char* file, int line)
    : BlobxlException(message, code, file, line)
    , worksheet_name_(worksheet_name) {
}

// XMLException 实现
XMLException::XMLException(const std::string& message,
                           const std::string& xml_path,
                           int xml_line, const char* file, int line)
    : BlobxlException(message, ErrorCode::XmlParseError, file, line)
    , xml_path_(xml_path)
    , xml_line_(xml_line) {
}

} // namespace core
} // namespace blobxl
