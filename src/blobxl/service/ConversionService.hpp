#pragma once

#include "blobxl/core/Expected.hpp"
#include "blobxl/service/ServiceOptions.hpp"
#include "blobxl/storage/IBlobStore.hpp"
#include <string>

namespace blobxl {
namespace service {

struct ConversionResult {
    std::string excel_url;
    std::string blob_name;
    size_t file_count = 0;
    size_t byte_count = 0;
};

/**
 * @brief 枚举 -> 组装 -> 发布
 *
 * 每个阶段的异常在此转换为 core::Error：
 * 无输入对象为 NotFound，其余沿用异常携带的错误码。
 */
class ConversionService {
public:
    explicit ConversionService(ServiceOptions options = ServiceOptions());

    core::Result<ConversionResult> convert(storage::IBlobStore& store, const std::string& excel_filename);

    const ServiceOptions& options() const { return options_; }

private:
    ServiceOptions options_;
};

}} // namespace blobxl::service
