#pragma once

#include "blobxl/storage/IBlobStore.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace blobxl {
namespace service {

/**
 * @brief 把工作簿字节写到容器根目录
 */
class SinkPublisher {
public:
    explicit SinkPublisher(storage::IBlobStore& store) : store_(store) {}

    /**
     * @return 对象地址
     * @throws StorageException 上传失败
     */
    std::string publish(const std::vector<uint8_t>& workbook, const std::string& excel_filename);

    /**
     * @brief 追加 ".xlsx"（已以其结尾时不变，大小写敏感）
     */
    static std::string targetName(const std::string& excel_filename);

private:
    storage::IBlobStore& store_;
};

}} // namespace blobxl::service
