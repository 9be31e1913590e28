#include "blobxl/storage/ConnectionString.hpp"
#include "blobxl/core/Exception.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include "blobxl/utils/TextUtils.hpp"
#include <cctype>
#include <unordered_map>

namespace blobxl {
namespace storage {

namespace {

constexpr const char* kDevelopmentKey =
    "Eby8vdM02xNOcqFlqUwJPLlmEtlCDXJ1OUzFT50uSRZ6IFsuFq2UVErCz4I6tq/K1SZFPTOtr/KBHBeksoGMGw==";

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::string toLower(std::string_view s) {
    std::string out(s);
    for (auto& ch : out) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    }
    return out;
}

[[noreturn]] void malformed() {
    throw core::StorageException(ConnectionString::kMalformedMessage, 0,
                                 core::ErrorCode::InvalidConnectionString, __FILE__, __LINE__);
}

} // namespace

ConnectionString ConnectionString::parse(std::string_view text) {
    text = trim(text);
    if (text.empty()) {
        malformed();
    }

    // 值中可能含 '='（base64 密钥、SAS 签名），只按第一个 '=' 切分
    std::unordered_map<std::string, std::string> settings;
    size_t pos = 0;
    while (pos <= text.size()) {
        size_t end = text.find(';', pos);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        const std::string_view segment = trim(text.substr(pos, end - pos));
        pos = end + 1;
        if (segment.empty()) {
            continue;
        }
        const size_t eq = segment.find('=');
        if (eq == std::string_view::npos || eq == 0) {
            malformed();
        }
        settings[toLower(trim(segment.substr(0, eq)))] = std::string(trim(segment.substr(eq + 1)));
    }

    auto value = [&settings](const char* key) -> std::string {
        auto it = settings.find(key);
        return it == settings.end() ? std::string() : it->second;
    };

    ConnectionString result;

    if (utils::TextUtils::equalsIgnoreCase(value("usedevelopmentstorage"), "true")) {
        result.development_ = true;
        result.account_name_ = kDevelopmentAccount;
        result.account_key_ = SecureString(kDevelopmentKey);
        result.blob_endpoint_ = kDevelopmentEndpoint;
        STORAGE_DEBUG("Using development storage endpoint {}", result.blob_endpoint_);
        return result;
    }

    result.account_name_ = value("accountname");
    result.account_key_ = SecureString(value("accountkey"));

    std::string sas = value("sharedaccesssignature");
    if (!sas.empty() && sas.front() == '?') {
        sas.erase(0, 1);
    }
    result.sas_token_ = SecureString(std::move(sas));

    std::string endpoint = value("blobendpoint");
    if (endpoint.empty()) {
        if (result.account_name_.empty()) {
            malformed();
        }
        std::string protocol = value("defaultendpointsprotocol");
        if (protocol.empty()) {
            protocol = "https";
        }
        std::string suffix = value("endpointsuffix");
        if (suffix.empty()) {
            suffix = "core.windows.net";
        }
        endpoint = protocol + "://" + result.account_name_ + ".blob." + suffix;
    }
    while (!endpoint.empty() && endpoint.back() == '/') {
        endpoint.pop_back();
    }
    result.blob_endpoint_ = std::move(endpoint);

    // 共享密钥签名需要账户名；两种凭据都没有则无法访问
    if (result.hasSharedKey() && result.account_name_.empty()) {
        malformed();
    }
    if (!result.hasSharedKey() && !result.hasSasToken()) {
        malformed();
    }

    STORAGE_DEBUG("Parsed connection string: account='{}', endpoint={}, auth={}",
                  result.account_name_, result.blob_endpoint_,
                  result.hasSharedKey() ? "SharedKey" : "SAS");
    return result;
}

}} // namespace blobxl::storage
