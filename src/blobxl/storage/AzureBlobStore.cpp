#include "blobxl/storage/AzureBlobStore.hpp"
#include "blobxl/core/Exception.hpp"
#include "blobxl/xml/XMLStreamWriter.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include <fmt/chrono.h>
#include <fmt/format.h>
#include <algorithm>
#include <iterator>

namespace blobxl {
namespace storage {

AzureBlobStore::AzureBlobStore(std::shared_ptr<const AzureAccount> account,
                               std::string container_name,
                               std::shared_ptr<HttpTransport> transport,
                               AzureOptions options)
    : account_(std::move(account))
    , container_(std::move(container_name))
    , transport_(std::move(transport))
    , options_(std::move(options)) {
    if (options_.block_size == 0) {
        throw core::BlobxlException("Block size must be positive", core::ErrorCode::InvalidArgument,
                                    __FILE__, __LINE__);
    }
}

std::string AzureBlobStore::formatHttpDate(std::time_t time) {
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time);
#else
    gmtime_r(&time, &tm);
#endif
    return fmt::format("{:%a, %d %b %Y %H:%M:%S} GMT", tm);
}

std::string AzureBlobStore::blockId(size_t index) {
    return base64Encode(fmt::format("{:06d}", index));
}

std::string AzureBlobStore::containerUrl() const {
    return account_->endpoint + "/" + urlEncode(container_);
}

std::string AzureBlobStore::blobUrl(const std::string& name) const {
    return containerUrl() + "/" + urlEncode(name, true);
}

void AzureBlobStore::prepare(HttpRequest& request) const {
    const std::time_t now = clock_ ? clock_() : std::time(nullptr);
    request.setHeader("x-ms-date", formatHttpDate(now));
    request.setHeader("x-ms-version", options_.api_version);
    if (account_->signer) {
        account_->signer->sign(request);
    } else if (!account_->sas_token.empty()) {
        request.raw_query = account_->sas_token.str();
    }
}

HttpResponse AzureBlobStore::execute(HttpRequest& request, const std::string& operation) {
    prepare(request);
    HttpResponse response = transport_->perform(request);
    if (response.isSuccess()) {
        return response;
    }

    std::string code;
    std::string message;
    if (!BlobListParser::parseError(response.body, code, message)) {
        code = response.header("x-ms-error-code");
    }
    if (message.empty()) {
        message = "The storage service rejected the request";
    }
    // 服务返回的消息可能跨多行（含 RequestId 与时间）
    const size_t newline = message.find('\n');
    if (newline != std::string::npos) {
        message.erase(newline);
    }
    const std::string text = fmt::format("{} failed for container '{}': {} (ErrorCode: {}, HTTP {})",
                                         operation, container_, message,
                                         code.empty() ? "Unknown" : code, response.status);
    STORAGE_ERROR("{}", text);
    throw core::StorageException(text, static_cast<int>(response.status), core::ErrorCode::StorageAccess,
                                 __FILE__, __LINE__);
}

std::vector<BlobItem> AzureBlobStore::listBlobs(const std::string& prefix) {
    std::vector<BlobItem> result;
    std::string marker;
    size_t pages = 0;
    do {
        HttpRequest request;
        request.method = "GET";
        request.url = containerUrl();
        request.query["restype"] = "container";
        request.query["comp"] = "list";
        if (!prefix.empty()) {
            request.query["prefix"] = prefix;
        }
        if (!marker.empty()) {
            request.query["marker"] = marker;
        }

        HttpResponse response = execute(request, "List Blobs");
        BlobListPage page = BlobListParser::parse(response.body);
        std::move(page.blobs.begin(), page.blobs.end(), std::back_inserter(result));
        marker = std::move(page.next_marker);
        ++pages;
    } while (!marker.empty());

    STORAGE_INFO("Listed {} blobs with prefix '{}' in container '{}' ({} pages)",
                 result.size(), prefix, container_, pages);
    return result;
}

std::string AzureBlobStore::download(const std::string& name) {
    HttpRequest request;
    request.method = "GET";
    request.url = blobUrl(name);
    HttpResponse response = execute(request, "Get Blob " + name);
    STORAGE_DEBUG("Downloaded {} ({} bytes)", name, response.body.size());
    return std::move(response.body);
}

std::string AzureBlobStore::upload(const std::string& name, const std::vector<uint8_t>& data) {
    if (data.size() <= options_.single_put_limit) {
        putBlob(name, data);
    } else {
        putBlocks(name, data);
    }
    STORAGE_INFO("Uploaded {} ({} bytes) to container '{}'", name, data.size(), container_);
    return blobUrl(name);
}

void AzureBlobStore::putBlob(const std::string& name, const std::vector<uint8_t>& data) {
    HttpRequest request;
    request.method = "PUT";
    request.url = blobUrl(name);
    request.setHeader("Content-Type", "application/octet-stream");
    request.setHeader("x-ms-blob-type", "BlockBlob");
    request.body = std::string_view(reinterpret_cast<const char*>(data.data()), data.size());
    execute(request, "Put Blob " + name);
}

void AzureBlobStore::putBlocks(const std::string& name, const std::vector<uint8_t>& data) {
    const char* bytes = reinterpret_cast<const char*>(data.data());
    std::vector<std::string> block_ids;

    for (size_t offset = 0; offset < data.size(); offset += options_.block_size) {
        const size_t length = std::min(options_.block_size, data.size() - offset);
        const std::string id = blockId(block_ids.size());

        HttpRequest request;
        request.method = "PUT";
        request.url = blobUrl(name);
        request.query["comp"] = "block";
        request.query["blockid"] = id;
        request.setHeader("Content-Type", "application/octet-stream");
        request.body = std::string_view(bytes + offset, length);
        execute(request, "Put Block " + name);
        block_ids.push_back(id);
    }

    xml::XMLStreamWriter writer;
    writer.startDocument();
    writer.startElement("BlockList");
    for (const auto& id : block_ids) {
        writer.startElement("Latest");
        writer.writeText(id);
        writer.endElement(); // Latest
    }
    writer.endElement(); // BlockList
    writer.endDocument();
    const std::string body = writer.takeString();

    HttpRequest request;
    request.method = "PUT";
    request.url = blobUrl(name);
    request.query["comp"] = "blocklist";
    request.setHeader("Content-Type", "application/xml");
    request.setHeader("x-ms-blob-content-type", "application/octet-stream");
    request.body = body;
    execute(request, "Put Block List " + name);
    STORAGE_DEBUG("Committed {} blocks for {}", block_ids.size(), name);
}

AzureStorageContext::AzureStorageContext(const SecureString& connection_string,
                                         AzureOptions options,
                                         std::shared_ptr<HttpTransport> transport)
    : transport_(std::move(transport))
    , options_(std::move(options)) {
    ConnectionString parsed = ConnectionString::parse(connection_string.str());

    auto account = std::make_shared<AzureAccount>();
    account->endpoint = parsed.blobEndpoint();
    account->account_name = parsed.accountName();
    if (parsed.hasSharedKey()) {
        account->signer.emplace(parsed.accountName(), parsed.accountKey());
    } else {
        account->sas_token = SecureString(parsed.sasToken().str());
    }
    account_ = std::move(account);

    if (!transport_) {
        transport_ = std::make_shared<CurlTransport>(options_.http);
    }
}

std::unique_ptr<IBlobStore> AzureStorageContext::openContainer(const std::string& container_name) {
    return std::make_unique<AzureBlobStore>(account_, container_name, transport_, options_);
}

}} // namespace blobxl::storage
