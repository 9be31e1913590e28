#pragma once

#include "blobxl/storage/SecureString.hpp"
#include <string>
#include <string_view>

namespace blobxl {
namespace storage {

/**
 * @brief Azure 存储连接字符串
 *
 * 识别的键（大小写不敏感）：
 * DefaultEndpointsProtocol, AccountName, AccountKey, EndpointSuffix,
 * BlobEndpoint, SharedAccessSignature, UseDevelopmentStorage。
 * 其余键被忽略。
 */
class ConnectionString {
public:
    static constexpr const char* kMalformedMessage = "Connection string is either blank or malformed.";
    static constexpr const char* kDevelopmentAccount = "devstoreaccount1";
    static constexpr const char* kDevelopmentEndpoint = "http://127.0.0.1:10000/devstoreaccount1";

    /**
     * @brief 解析连接字符串
     * @throws StorageException 空串、缺少账户或凭据（InvalidConnectionString）
     */
    static ConnectionString parse(std::string_view text);

    ConnectionString(ConnectionString&&) noexcept = default;
    ConnectionString& operator=(ConnectionString&&) noexcept = default;

    const std::string& accountName() const { return account_name_; }
    const SecureString& accountKey() const { return account_key_; }
    const SecureString& sasToken() const { return sas_token_; }

    // 不带结尾 '/'
    const std::string& blobEndpoint() const { return blob_endpoint_; }

    bool hasSharedKey() const { return !account_key_.empty(); }
    bool hasSasToken() const { return !sas_token_.empty(); }
    bool isDevelopmentStorage() const { return development_; }

private:
    ConnectionString() = default;

    std::string account_name_;
    SecureString account_key_;
    SecureString sas_token_;
    std::string blob_endpoint_;
    bool development_ = false;
};

}} // namespace blobxl::storage
