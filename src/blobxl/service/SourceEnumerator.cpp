#include "blobxl/service/SourceEnumerator.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include "blobxl/utils/TextUtils.hpp"

namespace blobxl {
namespace service {

SourceEnumerator::SourceEnumerator(storage::IBlobStore& store, std::string prefix, std::string extension)
    : store_(store)
    , prefix_(std::move(prefix))
    , extension_(std::move(extension)) {
}

std::string SourceEnumerator::baseName(const std::string& object_name) {
    const size_t slash = object_name.rfind('/');
    return slash == std::string::npos ? object_name : object_name.substr(slash + 1);
}

core::TableSet SourceEnumerator::enumerate() {
    SERVICE_INFO("Connecting to blob container {}", store_.containerName());

    core::TableSet tables;
    matched_ = 0;
    for (const auto& blob : store_.listBlobs(prefix_)) {
        if (!utils::TextUtils::startsWith(blob.name, prefix_) ||
            !utils::TextUtils::endsWith(blob.name, extension_)) {
            continue;
        }
        ++matched_;
        SERVICE_INFO("Found CSV file: {}", blob.name);

        const std::string content = store_.download(blob.name);
        core::Table table = parser_.parse(content, blob.name);

        const std::string key = baseName(blob.name);
        if (!tables.insertOrAssign(key, std::move(table))) {
            SERVICE_WARN("{} replaces an earlier object with the same base name '{}'", blob.name, key);
        }
    }

    SERVICE_INFO("Total CSV files found in {} directory: {}", prefix_, matched_);
    return tables;
}

}} // namespace blobxl::service
