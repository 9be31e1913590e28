#include "blobxl/archive/ZipWriter.hpp"
#include "blobxl/utils/ModuleLoggers.hpp"
#include <mz.h>
#include <mz_strm.h>
#include <mz_strm_mem.h>
#include <mz_zip.h>
#include <mz_zip_rw.h>
#include <climits>
#include <ctime>

namespace blobxl {
namespace archive {

namespace {
constexpr int32_t kMemoryGrowSize = 128 * 1024;
}

ZipWriter::ZipWriter() = default;

ZipWriter::~ZipWriter() {
    cleanup();
}

bool ZipWriter::open() {
    cleanup();
    buffer_.clear();
    finalized_ = false;
    stats_ = Stats{};

    mem_stream_ = mz_stream_mem_create();
    if (!mem_stream_) {
        ARCHIVE_ERROR("Failed to create memory stream");
        return false;
    }
    mz_stream_mem_set_grow_size(mem_stream_, kMemoryGrowSize);
    if (mz_stream_open(mem_stream_, nullptr, MZ_OPEN_MODE_CREATE) != MZ_OK) {
        ARCHIVE_ERROR("Failed to open memory stream");
        cleanup();
        return false;
    }

    zip_handle_ = mz_zip_writer_create();
    if (!zip_handle_) {
        ARCHIVE_ERROR("Failed to create zip writer");
        cleanup();
        return false;
    }

    mz_zip_writer_set_compress_method(zip_handle_,
        compression_level_ == 0 ? MZ_COMPRESS_METHOD_STORE : MZ_COMPRESS_METHOD_DEFLATE);
    mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));

    int32_t result = mz_zip_writer_open(zip_handle_, mem_stream_, 0);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open zip writer on memory stream, error: {}", result);
        cleanup();
        return false;
    }

    // 禁用 Data Descriptor 以兼容 Excel
    void* zip_handle = nullptr;
    if (mz_zip_writer_get_zip_handle(zip_handle_, &zip_handle) == MZ_OK && zip_handle) {
        mz_zip_set_data_descriptor(zip_handle, 0);
    }

    is_open_ = true;
    ARCHIVE_DEBUG("In-memory ZIP archive opened, compression level {}", compression_level_);
    return true;
}

bool ZipWriter::close() {
    if (!is_open_ || !zip_handle_) {
        return finalized_;
    }

    bool success = true;
    int32_t result = mz_zip_writer_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to finalize ZIP archive, error code: {}", result);
        success = false;
    } else {
        const void* data = nullptr;
        int32_t length = 0;
        mz_stream_mem_get_buffer_length(mem_stream_, &length);
        if (length > 0 && mz_stream_mem_get_buffer(mem_stream_, &data) == MZ_OK && data) {
            const auto* bytes = static_cast<const uint8_t*>(data);
            buffer_.assign(bytes, bytes + length);
            ARCHIVE_DEBUG("ZIP archive finalized: {} entries, {} bytes", stats_.entries_written, buffer_.size());
        } else {
            ARCHIVE_ERROR("ZIP archive finalized but the memory stream is empty");
            success = false;
        }
    }

    is_open_ = false;
    finalized_ = success;
    cleanup();
    return success;
}

ZipError ZipWriter::addFile(std::string_view internal_path, std::string_view content) {
    return addFile(internal_path, content.data(), content.size());
}

ZipError ZipWriter::addFile(std::string_view internal_path, const void* data, size_t size) {
    if (!is_open_ || !zip_handle_) {
        ARCHIVE_ERROR("Zip archive not opened for writing");
        return ZipError::NotOpen;
    }
    if (internal_path.empty()) {
        return ZipError::InvalidParameter;
    }
    return writeFileEntry(std::string(internal_path), data, size);
}

ZipError ZipWriter::setCompressionLevel(int level) {
    if (level < 0 || level > 9) {
        ARCHIVE_ERROR("Invalid compression level: {}. Valid range: 0 to 9", level);
        return ZipError::InvalidParameter;
    }
    compression_level_ = level;
    if (is_open_ && zip_handle_) {
        mz_zip_writer_set_compress_level(zip_handle_, static_cast<int16_t>(compression_level_));
    }
    return ZipError::Ok;
}

std::vector<uint8_t> ZipWriter::takeBuffer() {
    std::vector<uint8_t> out;
    out.swap(buffer_);
    finalized_ = false;
    return out;
}

void ZipWriter::cleanup() {
    if (zip_handle_) {
        if (is_open_) {
            mz_zip_writer_close(zip_handle_);
        }
        mz_zip_writer_delete(&zip_handle_);
        zip_handle_ = nullptr;
    }
    if (mem_stream_) {
        mz_stream_close(mem_stream_);
        mz_stream_mem_delete(&mem_stream_);
        mem_stream_ = nullptr;
    }
    is_open_ = false;
    written_paths_.clear();
}

void ZipWriter::initializeFileInfo(void* file_info_ptr, const std::string& path, size_t size) {
    mz_zip_file& file_info = *static_cast<mz_zip_file*>(file_info_ptr);
    file_info = {};
    file_info.filename = path.c_str();
    file_info.uncompressed_size = static_cast<int64_t>(size);
    file_info.compressed_size = 0;
    file_info.compression_method = compression_level_ == 0 ? MZ_COMPRESS_METHOD_STORE
                                                           : MZ_COMPRESS_METHOD_DEFLATE;

    const std::time_t now = std::time(nullptr);
    file_info.modified_date = now;
    file_info.creation_date = now;
    file_info.flag = 0;

#ifdef _WIN32
    file_info.version_madeby = (MZ_HOST_SYSTEM_WINDOWS_NTFS << 8) | 20;
#else
    file_info.version_madeby = (MZ_HOST_SYSTEM_UNIX << 8) | 20;
#endif
}

ZipError ZipWriter::writeFileEntry(const std::string& internal_path, const void* data, size_t size) {
    if (written_paths_.find(internal_path) != written_paths_.end()) {
        ARCHIVE_WARN("Entry {} already exists in zip, skipping duplicate", internal_path);
        return ZipError::Ok;
    }

    if (size > INT32_MAX) {
        ARCHIVE_ERROR("Entry {} is too large ({} bytes)", internal_path, size);
        return ZipError::TooLarge;
    }

    mz_zip_file file_info;
    initializeFileInfo(&file_info, internal_path, size);

    int32_t result = mz_zip_writer_entry_open(zip_handle_, &file_info);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to open entry {} in zip, error: {}", internal_path, result);
        return ZipError::IoFail;
    }

    if (size > 0) {
        int32_t bytes_written = mz_zip_writer_entry_write(zip_handle_, data, static_cast<int32_t>(size));
        if (bytes_written != static_cast<int32_t>(size)) {
            ARCHIVE_ERROR("Failed to write complete data for entry {}", internal_path);
            mz_zip_writer_entry_close(zip_handle_);
            return ZipError::IoFail;
        }
    }

    result = mz_zip_writer_entry_close(zip_handle_);
    if (result != MZ_OK) {
        ARCHIVE_ERROR("Failed to close entry {} in zip, error: {}", internal_path, result);
        return ZipError::IoFail;
    }

    written_paths_.insert(internal_path);
    stats_.entries_written++;
    stats_.bytes_written += size;
    ARCHIVE_DEBUG("Added entry {}, size: {} bytes", internal_path, size);
    return ZipError::Ok;
}

}} // namespace blobxl::archive
