#pragma once

#include "blobxl/storage/ConnectionString.hpp"
#include "blobxl/storage/HttpClient.hpp"
#include "blobxl/storage/IBlobStore.hpp"
#include "blobxl/storage/SharedKeySigner.hpp"
#include <cstddef>
#include <ctime>
#include <functional>
#include <memory>
#include <optional>

namespace blobxl {
namespace storage {

struct AzureOptions {
    std::string api_version = "2020-10-02";
    size_t single_put_limit = 64 * 1024 * 1024;   // 超过此大小改用分块上传
    size_t block_size = 4 * 1024 * 1024;
    HttpOptions http;
};

/**
 * @brief 共享一个连接字符串的账户级状态
 */
struct AzureAccount {
    std::string endpoint;
    std::string account_name;
    std::optional<SharedKeySigner> signer;
    SecureString sas_token;
};

/**
 * @brief Azure Blob REST 客户端（单个容器）
 */
class AzureBlobStore : public IBlobStore {
public:
    using Clock = std::function<std::time_t()>;

    AzureBlobStore(std::shared_ptr<const AzureAccount> account,
                   std::string container_name,
                   std::shared_ptr<HttpTransport> transport,
                   AzureOptions options = AzureOptions());

    const std::string& containerName() const override { return container_; }

    std::vector<BlobItem> listBlobs(const std::string& prefix) override;
    std::string download(const std::string& name) override;
    std::string upload(const std::string& name, const std::vector<uint8_t>& data) override;
    std::string blobUrl(const std::string& name) const override;

    void setClock(Clock clock) { clock_ = std::move(clock); }

    /**
     * @brief RFC 1123 格式的 GMT 时间，如 "Sun, 06 Nov 1994 08:49:37 GMT"
     */
    static std::string formatHttpDate(std::time_t time);

    /**
     * @brief 第 index 个块的 id：base64("%06d")，所有 id 等长
     */
    static std::string blockId(size_t index);

private:
    std::shared_ptr<const AzureAccount> account_;
    std::string container_;
    std::shared_ptr<HttpTransport> transport_;
    AzureOptions options_;
    Clock clock_;

    std::string containerUrl() const;

    void prepare(HttpRequest& request) const;
    HttpResponse execute(HttpRequest& request, const std::string& operation);

    void putBlob(const std::string& name, const std::vector<uint8_t>& data);
    void putBlocks(const std::string& name, const std::vector<uint8_t>& data);
};

/**
 * @brief 由连接字符串构造的 Azure 存储上下文
 */
class AzureStorageContext : public IStorageContext {
public:
    /**
     * @throws StorageException 连接字符串无效
     */
    AzureStorageContext(const SecureString& connection_string,
                        AzureOptions options = AzureOptions(),
                        std::shared_ptr<HttpTransport> transport = nullptr);

    std::unique_ptr<IBlobStore> openContainer(const std::string& container_name) override;

    const AzureAccount& account() const { return *account_; }

private:
    std::shared_ptr<const AzureAccount> account_;
    std::shared_ptr<HttpTransport> transport_;
    AzureOptions options_;
};

}} // namespace blobxl::storage
