#include "blobxl/storage/SharedKeySigner.hpp"
#include "blobxl/core/Exception.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <algorithm>
#include <cctype>
#include <vector>

namespace blobxl {
namespace storage {

namespace {

std::string toLower(std::string s) {
    for (auto& ch : s) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return s;
}

} // namespace

std::string base64Encode(std::string_view data) {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                        reinterpret_cast<const unsigned char*>(data.data()),
                                        static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

std::string base64Decode(std::string_view text) {
    if (text.empty()) {
        return {};
    }
    if (text.size() % 4 != 0) {
        throw core::StorageException("Invalid base64 length", 0, core::ErrorCode::InvalidConnectionString,
                                     __FILE__, __LINE__);
    }
    std::string out(3 * text.size() / 4, '\0');
    const int written = EVP_DecodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                        reinterpret_cast<const unsigned char*>(text.data()),
                                        static_cast<int>(text.size()));
    if (written < 0) {
        throw core::StorageException("Invalid base64 data", 0, core::ErrorCode::InvalidConnectionString,
                                     __FILE__, __LINE__);
    }
    // EVP_DecodeBlock 不去除填充产生的零字节
    size_t padding = 0;
    if (text.back() == '=') {
        ++padding;
        if (text[text.size() - 2] == '=') {
            ++padding;
        }
    }
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

std::string hmacSha256(std::string_view key, std::string_view data) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()),
             reinterpret_cast<const unsigned char*>(data.data()), data.size(),
             digest, &length) == nullptr) {
        throw core::StorageException("HMAC-SHA256 failed", 0, core::ErrorCode::StorageAccess, __FILE__, __LINE__);
    }
    return std::string(reinterpret_cast<const char*>(digest), length);
}

SharedKeySigner::SharedKeySigner(std::string account_name, const SecureString& account_key)
    : account_name_(std::move(account_name))
    , key_(base64Decode(account_key.str())) {
}

std::string SharedKeySigner::stringToSign(const HttpRequest& request) const {
    std::string result;
    result += request.method + "\n";
    result += request.header("Content-Encoding") + "\n";
    result += request.header("Content-Language") + "\n";
    // 2015-02-21 之后的版本，长度为 0 时留空
    result += (request.body.empty() ? std::string() : std::to_string(request.body.size())) + "\n";
    result += request.header("Content-MD5") + "\n";
    result += request.header("Content-Type") + "\n";
    result += request.header("Date") + "\n";
    result += request.header("If-Modified-Since") + "\n";
    result += request.header("If-Match") + "\n";
    result += request.header("If-None-Match") + "\n";
    result += request.header("If-Unmodified-Since") + "\n";
    result += request.header("Range") + "\n";

    std::vector<std::pair<std::string, std::string>> ms_headers;
    for (const auto& [name, value] : request.headers) {
        std::string lower = toLower(name);
        if (lower.compare(0, 5, "x-ms-") == 0) {
            ms_headers.emplace_back(std::move(lower), value);
        }
    }
    std::sort(ms_headers.begin(), ms_headers.end());
    for (const auto& [name, value] : ms_headers) {
        result += name + ":" + value + "\n";
    }

    result += "/" + account_name_ + urlPath(request.url);

    // 查询参数：名称小写后排序，值为未编码形式
    std::vector<std::pair<std::string, std::string>> params;
    for (const auto& [name, value] : request.query) {
        params.emplace_back(toLower(name), value);
    }
    std::sort(params.begin(), params.end());
    for (const auto& [name, value] : params) {
        result += "\n" + name + ":" + value;
    }
    return result;
}

void SharedKeySigner::sign(HttpRequest& request) const {
    const std::string signature = base64Encode(hmacSha256(key_.str(), stringToSign(request)));
    request.setHeader("Authorization", "SharedKey " + account_name_ + ":" + signature);
}

}} // namespace blobxl::storage
