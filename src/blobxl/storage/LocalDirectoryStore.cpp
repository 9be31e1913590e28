#include "blobxl/storage/LocalDirectoryStore.hpp"
#include "blobxl/core/Exception.hpp"
#include "blobxl/storage/HttpClient.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

namespace fs = std::filesystem;

namespace blobxl {
namespace storage {

LocalDirectoryStore::LocalDirectoryStore(fs::path root)
    : root_(std::move(root)) {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        throw core::StorageException(fmt::format("Container directory '{}' does not exist", root_.string()),
                                     404, core::ErrorCode::StorageAccess, __FILE__, __LINE__);
    }
    root_ = fs::absolute(root_, ec).lexically_normal();
    if (!root_.has_filename() && root_.has_parent_path() && root_ != root_.root_path()) {
        root_ = root_.parent_path();
    }
    name_ = root_.filename().string();
}

fs::path LocalDirectoryStore::resolve(const std::string& name) const {
    const fs::path relative = fs::path(name).lexically_normal();
    if (name.empty() || relative.is_absolute() || (!relative.empty() && *relative.begin() == "..")) {
        throw core::StorageException(fmt::format("Invalid object name '{}'", name), 400,
                                     core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }
    return root_ / relative;
}

std::vector<BlobItem> LocalDirectoryStore::listBlobs(const std::string& prefix) {
    std::vector<BlobItem> result;
    std::error_code ec;
    fs::recursive_directory_iterator it(root_, ec);
    if (ec) {
        throw core::StorageException(fmt::format("Cannot list '{}': {}", root_.string(), ec.message()), 0,
                                     core::ErrorCode::StorageAccess, __FILE__, __LINE__);
    }
    for (const auto& entry : it) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const std::string name = entry.path().lexically_relative(root_).generic_string();
        if (name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        BlobItem item;
        item.name = name;
        item.content_length = static_cast<uint64_t>(entry.file_size());
        result.push_back(std::move(item));
    }
    // 与 Azure 一致，按名字字典序返回
    std::sort(result.begin(), result.end(),
              [](const BlobItem& a, const BlobItem& b) { return a.name < b.name; });
    STORAGE_INFO("Listed {} files with prefix '{}' under {}", result.size(), prefix, root_.string());
    return result;
}

std::string LocalDirectoryStore::download(const std::string& name) {
    const fs::path path = resolve(name);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw core::StorageException(fmt::format("Cannot open '{}' for reading", path.string()), 404,
                                     core::ErrorCode::FileReadError, __FILE__, __LINE__);
    }
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (in.bad()) {
        throw core::StorageException(fmt::format("Failed to read '{}'", path.string()), 0,
                                     core::ErrorCode::FileReadError, __FILE__, __LINE__);
    }
    STORAGE_DEBUG("Read {} ({} bytes)", path.string(), content.size());
    return content;
}

std::string LocalDirectoryStore::upload(const std::string& name, const std::vector<uint8_t>& data) {
    const fs::path path = resolve(name);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        throw core::StorageException(fmt::format("Cannot create directory '{}': {}",
                                                 path.parent_path().string(), ec.message()),
                                     0, core::ErrorCode::FileWriteError, __FILE__, __LINE__);
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw core::StorageException(fmt::format("Cannot open '{}' for writing", path.string()), 0,
                                     core::ErrorCode::FileWriteError, __FILE__, __LINE__);
    }
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out.close();
    if (!out) {
        throw core::StorageException(fmt::format("Failed to write '{}'", path.string()), 0,
                                     core::ErrorCode::FileWriteError, __FILE__, __LINE__);
    }
    STORAGE_INFO("Wrote {} ({} bytes)", path.string(), data.size());
    return blobUrl(name);
}

std::string LocalDirectoryStore::blobUrl(const std::string& name) const {
    return "file://" + urlEncode(root_.generic_string(), true) + "/" + urlEncode(name, true);
}

std::unique_ptr<IBlobStore> LocalStorageContext::openContainer(const std::string& container_name) {
    if (container_name.empty() || container_name.find('/') != std::string::npos ||
        container_name.find('\\') != std::string::npos || container_name == "..") {
        throw core::StorageException(fmt::format("Invalid container name '{}'", container_name), 400,
                                     core::ErrorCode::InvalidArgument, __FILE__, __LINE__);
    }
    return std::make_unique<LocalDirectoryStore>(root_ / container_name);
}

}} // namespace blobxl::storage
