#include "blobxl/storage/BlobListParser.hpp"
#include "blobxl/core/Exception.hpp"
#include "blobxl/xml/XMLStreamReader.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include <fmt/format.h>

namespace blobxl {
namespace storage {

BlobListPage BlobListParser::parse(const std::string& xml) {
    std::unique_ptr<xml::XMLStreamReader::SimpleElement> root;
    try {
        xml::XMLStreamReader reader;
        root = reader.parseToDOM(xml);
    } catch (const core::XMLException& e) {
        throw core::StorageException(fmt::format("Invalid List Blobs response: {}", e.what()), 0,
                                     core::ErrorCode::StorageAccess, __FILE__, __LINE__);
    }
    if (!root || root->name != "EnumerationResults") {
        throw core::StorageException("Invalid List Blobs response: missing EnumerationResults", 0,
                                     core::ErrorCode::StorageAccess, __FILE__, __LINE__);
    }

    BlobListPage page;
    page.next_marker = root->childText("NextMarker");

    if (const auto* blobs = root->findChild("Blobs")) {
        for (const auto* blob : blobs->findChildren("Blob")) {
            BlobItem item;
            item.name = blob->childText("Name");
            if (item.name.empty()) {
                continue;
            }
            if (const auto* length = blob->findChildByPath("Properties/Content-Length")) {
                try {
                    item.content_length = std::stoull(length->text);
                } catch (const std::exception&) {
                    STORAGE_WARN("Ignoring bad Content-Length '{}' for {}", length->text, item.name);
                }
            }
            page.blobs.push_back(std::move(item));
        }
    }
    STORAGE_DEBUG("List Blobs page: {} blobs, next marker '{}'", page.blobs.size(), page.next_marker);
    return page;
}

bool BlobListParser::parseError(const std::string& xml, std::string& code, std::string& message) {
    xml::XMLStreamReader reader;
    std::unique_ptr<xml::XMLStreamReader::SimpleElement> root;
    try {
        root = reader.parseToDOM(xml);
    } catch (const core::XMLException&) {
        return false;
    }
    if (!root || root->name != "Error") {
        return false;
    }
    code = root->childText("Code");
    message = root->childText("Message");
    return true;
}

}} // namespace blobxl::storage
