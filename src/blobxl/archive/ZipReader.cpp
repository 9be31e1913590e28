#include "blobxl/archive/ZipReader.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>

namespace blobxl {
namespace archive {

ZipReader::ZipReader() = default;

ZipReader::~ZipReader() {
    cleanup();
}

bool ZipReader::open(const std::vector<uint8_t>& data) {
    cleanup();

    if (data.empty() || data.size() > INT32_MAX) {
        ARCHIVE_ERROR("Cannot open ZIP buffer of {} bytes", data.size());
        return false;
    }
    data_ = data;

    unzip_handle_ = mz_zip_reader_create();
    if (!unzip_handle_) {
        ARCHIVE_ERROR("Failed to create zip reader");
        return false;
    }

    int32_t result = mz_zip_reader_open_buffer(unzip_handle_, data_.data(),
                                               static_cast<int32_t>(data_.size()), 0);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip buffer for reading, error: {}", result);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
        return false;
    }

    is_open_ = true;
    buildEntryCache();
    ARCHIVE_DEBUG("Zip buffer opened for reading: {} bytes, {} entries", data_.size(), entry_cache_.size());
    return true;
}

bool ZipReader::close() {
    cleanup();
    return true;
}

std::vector<std::string> ZipReader::listFiles() const {
    std::vector<std::string> files;
    files.reserve(entry_cache_.size());
    for (const auto& [path, info] : entry_cache_) {
        files.push_back(path);
    }
    return files;
}

ZipError ZipReader::fileExists(std::string_view internal_path) const {
    if (!is_open_) {
        return ZipError::NotOpen;
    }
    return entry_cache_.count(std::string(internal_path)) ? ZipError::Ok : ZipError::FileNotFound;
}

bool ZipReader::getEntryInfo(std::string_view internal_path, EntryInfo& info) const {
    auto it = entry_cache_.find(std::string(internal_path));
    if (it == entry_cache_.end()) {
        return false;
    }
    info = it->second;
    return true;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::string& content) {
    std::vector<uint8_t> data;
    ZipError result = extractFile(internal_path, data);
    if (result != ZipError::Ok) {
        return result;
    }
    content.assign(reinterpret_cast<const char*>(data.data()), data.size());
    return ZipError::Ok;
}

ZipError ZipReader::extractFile(std::string_view internal_path, std::vector<uint8_t>& data) {
    if (!is_open_ || !unzip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for reading");
        return ZipError::NotOpen;
    }

    const std::string path_str(internal_path);
    if (mz_zip_reader_locate_entry(unzip_handle_, path_str.c_str(), 0) != MZ_OK) {
        ARCHIVE_DEBUG("Entry {} not found in zip archive", internal_path);
        return ZipError::FileNotFound;
    }

    mz_zip_file* info = nullptr;
    if (mz_zip_reader_entry_get_info(unzip_handle_, &info) != MZ_OK || !info) {
        return ZipError::BadFormat;
    }
    if (info->uncompressed_size > INT32_MAX) {
        return ZipError::TooLarge;
    }

    std::vector<uint8_t> buf(static_cast<size_t>(info->uncompressed_size));
    if (mz_zip_reader_entry_open(unzip_handle_) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry {}", internal_path);
        return ZipError::IoFail;
    }
    int32_t read = buf.empty() ? 0
                               : mz_zip_reader_entry_read(unzip_handle_, buf.data(), static_cast<int32_t>(buf.size()));
    mz_zip_reader_entry_close(unzip_handle_);
    if (read != static_cast<int32_t>(buf.size())) {
        ARCHIVE_ERROR("Short read on entry {}: {} of {} bytes", internal_path, read, buf.size());
        return ZipError::IoFail;
    }

    data.swap(buf);
    ARCHIVE_DEBUG("Extracted {} from zip, size: {} bytes", internal_path, data.size());
    return ZipError::Ok;
}

void ZipReader::cleanup() {
    if (unzip_handle_) {
        mz_zip_reader_close(unzip_handle_);
        mz_zip_reader_delete(&unzip_handle_);
        unzip_handle_ = nullptr;
    }
    is_open_ = false;
    entry_cache_.clear();
    data_.clear();
}

void ZipReader::buildEntryCache() {
    entry_cache_.clear();
    if (!unzip_handle_ || mz_zip_reader_goto_first_entry(unzip_handle_) != MZ_OK) {
        return;
    }

    do {
        mz_zip_file* file_info = nullptr;
        if (mz_zip_reader_entry_get_info(unzip_handle_, &file_info) == MZ_OK && file_info &&
            file_info->filename && file_info->filename[0] != '\0') {
            EntryInfo info;
            info.path = file_info->filename;
            info.compressed_size = static_cast<uint64_t>(file_info->compressed_size);
            info.uncompressed_size = static_cast<uint64_t>(file_info->uncompressed_size);
            info.crc32 = file_info->crc;
            info.compression_method = file_info->compression_method;
            info.is_directory = info.path.back() == '/';
            entry_cache_[info.path] = info;
        }
    } while (mz_zip_reader_goto_next_entry(unzip_handle_) == MZ_OK);
}

}} // namespace blobxl::archive
