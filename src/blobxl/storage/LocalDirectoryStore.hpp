#pragma once

#include "blobxl/storage/IBlobStore.hpp"
#include <filesystem>

namespace blobxl {
namespace storage {

/**
 * @brief 以本地目录模拟一个容器
 *
 * 对象名是相对于根目录、以 '/' 分隔的路径；地址为 file:// URL。
 */
class LocalDirectoryStore : public IBlobStore {
public:
    /**
     * @throws StorageException 根目录不存在
     */
    explicit LocalDirectoryStore(std::filesystem::path root);

    const std::string& containerName() const override { return name_; }

    std::vector<BlobItem> listBlobs(const std::string& prefix) override;
    std::string download(const std::string& name) override;
    std::string upload(const std::string& name, const std::vector<uint8_t>& data) override;
    std::string blobUrl(const std::string& name) const override;

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
    std::string name_;

    std::filesystem::path resolve(const std::string& name) const;
};

/**
 * @brief 根目录下的每个子目录是一个容器
 */
class LocalStorageContext : public IStorageContext {
public:
    explicit LocalStorageContext(std::filesystem::path root) : root_(std::move(root)) {}

    std::unique_ptr<IBlobStore> openContainer(const std::string& container_name) override;

private:
    std::filesystem::path root_;
};

}} // namespace blobxl::storage
