#pragma once

#include "blobxl/core/Exception.hpp"
#include "blobxl/storage/IBlobStore.hpp"
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace blobxl {
namespace test {

/**
 * @brief 测试用内存容器，记录每次调用
 */
class InMemoryBlobStore : public storage::IBlobStore {
public:
    explicit InMemoryBlobStore(std::string container = "testcontainer")
        : container_(std::move(container)) {}

    void put(const std::string& name, const std::string& content) { objects_[name] = content; }

    bool has(const std::string& name) const { return objects_.count(name) > 0; }
    const std::string& get(const std::string& name) const { return objects_.at(name); }

    const std::string& containerName() const override { return container_; }

    std::vector<storage::BlobItem> listBlobs(const std::string& prefix) override {
        ++list_calls;
        if (fail_list) {
            throw core::StorageException("Server failed to authenticate the request.", 403,
                                         core::ErrorCode::StorageAccess, __FILE__, __LINE__);
        }
        std::vector<storage::BlobItem> result;
        for (const auto& [name, content] : objects_) {
            if (name.compare(0, prefix.size(), prefix) == 0) {
                storage::BlobItem item;
                item.name = name;
                item.content_length = content.size();
                result.push_back(item);
            }
        }
        return result;
    }

    std::string download(const std::string& name) override {
        ++download_calls;
        auto it = objects_.find(name);
        if (it == objects_.end()) {
            throw core::StorageException("The specified blob does not exist.", 404,
                                         core::ErrorCode::StorageAccess, __FILE__, __LINE__);
        }
        return it->second;
    }

    std::string upload(const std::string& name, const std::vector<uint8_t>& data) override {
        ++upload_calls;
        if (fail_upload) {
            throw core::StorageException("Upload rejected", 500, core::ErrorCode::StorageAccess, __FILE__, __LINE__);
        }
        objects_[name] = std::string(data.begin(), data.end());
        return blobUrl(name);
    }

    std::string blobUrl(const std::string& name) const override {
        return "https://account.blob.core.windows.net/" + container_ + "/" + name;
    }

    int list_calls = 0;
    int download_calls = 0;
    int upload_calls = 0;
    bool fail_list = false;
    bool fail_upload = false;

private:
    std::string container_;
    std::map<std::string, std::string> objects_;
};

/**
 * @brief 转发到外部持有的存储，便于测试检查上传结果
 */
class BlobStoreProxy : public storage::IBlobStore {
public:
    explicit BlobStoreProxy(storage::IBlobStore& target) : target_(target) {}

    const std::string& containerName() const override { return target_.containerName(); }
    std::vector<storage::BlobItem> listBlobs(const std::string& prefix) override { return target_.listBlobs(prefix); }
    std::string download(const std::string& name) override { return target_.download(name); }
    std::string upload(const std::string& name, const std::vector<uint8_t>& data) override {
        return target_.upload(name, data);
    }
    std::string blobUrl(const std::string& name) const override { return target_.blobUrl(name); }

private:
    storage::IBlobStore& target_;
};

// 只认识一个容器的存储上下文
class InMemoryStorageContext : public storage::IStorageContext {
public:
    explicit InMemoryStorageContext(InMemoryBlobStore& store) : store_(store) {}

    std::unique_ptr<storage::IBlobStore> openContainer(const std::string& container_name) override {
        if (container_name != store_.containerName()) {
            throw core::StorageException("The specified container does not exist.", 404,
                                         core::ErrorCode::StorageAccess, __FILE__, __LINE__);
        }
        return std::make_unique<BlobStoreProxy>(store_);
    }

private:
    InMemoryBlobStore& store_;
};

}} // namespace blobxl::test
