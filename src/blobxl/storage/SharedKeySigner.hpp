#pragma once

#include "blobxl/storage/HttpClient.hpp"
#include "blobxl/storage/SecureString.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace blobxl {
namespace storage {

/**
 * @brief Azure Shared Key 请求签名
 *
 * 签名串格式：
 * VERB, Content-Encoding, Content-Language, Content-Length, Content-MD5,
 * Content-Type, Date, If-Modified-Since, If-Match, If-None-Match,
 * If-Unmodified-Since, Range 各占一行，之后是排序后的 x-ms-* 头与规范化资源。
 */
class SharedKeySigner {
public:
    /**
     * @throws StorageException 账户密钥不是合法 base64（InvalidConnectionString）
     */
    SharedKeySigner(std::string account_name, const SecureString& account_key);

    std::string stringToSign(const HttpRequest& request) const;

    /**
     * @brief 计算并设置 Authorization 头
     */
    void sign(HttpRequest& request) const;

    const std::string& accountName() const { return account_name_; }

private:
    std::string account_name_;
    SecureString key_;   // 解码后的密钥字节
};

// base64 与 HMAC，基于 OpenSSL libcrypto
std::string base64Encode(std::string_view data);

/**
 * @throws StorageException 输入不是合法 base64
 */
std::string base64Decode(std::string_view text);

std::string hmacSha256(std::string_view key, std::string_view data);

}} // namespace blobxl::storage
