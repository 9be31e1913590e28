#pragma once

#include "blobxl/storage/BlobListParser.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace blobxl {
namespace storage {

/**
 * @brief 单个容器的对象存储接口
 *
 * 所有失败以 StorageException 报告。
 */
class IBlobStore {
public:
    virtual ~IBlobStore() = default;

    virtual const std::string& containerName() const = 0;

    /**
     * @brief 列出名字以 prefix 开头的全部对象，按名字字典序
     */
    virtual std::vector<BlobItem> listBlobs(const std::string& prefix) = 0;

    /**
     * @brief 读取对象全部内容
     */
    virtual std::string download(const std::string& name) = 0;

    /**
     * @brief 覆盖写入对象
     * @return 对象地址（不含访问令牌）
     */
    virtual std::string upload(const std::string& name, const std::vector<uint8_t>& data) = 0;

    virtual std::string blobUrl(const std::string& name) const = 0;
};

/**
 * @brief 一次请求的存储上下文，由连接字符串构造
 */
class IStorageContext {
public:
    virtual ~IStorageContext() = default;

    virtual std::unique_ptr<IBlobStore> openContainer(const std::string& container_name) = 0;
};

}} // namespace blobxl::storage
