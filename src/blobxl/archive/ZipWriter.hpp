#pragma once

#include "blobxl/archive/ZipError.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <string_view>
#include <unordered_set>

namespace blobxl {
namespace archive {

/**
 * @brief 内存 ZIP 写入器
 *
 * 所有条目写入 minizip-ng 内存流，close() 之后通过 takeBuffer() 取出整个归档。
 * 同一路径只写一次，重复写入被忽略并记录警告。
 */
class ZipWriter {
public:
    ZipWriter();
    ~ZipWriter();

    ZipWriter(const ZipWriter&) = delete;
    ZipWriter& operator=(const ZipWriter&) = delete;

    /**
     * 创建内存归档
     * @return 是否成功
     */
    bool open();

    /**
     * 写出中央目录并结束归档
     * @return 是否成功
     */
    bool close();

    bool isOpen() const { return is_open_; }

    ZipError addFile(std::string_view internal_path, std::string_view content);
    ZipError addFile(std::string_view internal_path, const void* data, size_t size);

    /**
     * 设置压缩级别（0-9，0 为仅存储）
     */
    ZipError setCompressionLevel(int level);
    int getCompressionLevel() const { return compression_level_; }

    bool hasEntry(const std::string& internal_path) const {
        return written_paths_.count(internal_path) > 0;
    }

    /**
     * @brief 取出已完成的归档字节；必须在 close() 成功之后调用
     */
    std::vector<uint8_t> takeBuffer();

    struct Stats {
        size_t entries_written = 0;
        size_t bytes_written = 0;
    };
    Stats getStats() const { return stats_; }

private:
    void* zip_handle_ = nullptr;
    void* mem_stream_ = nullptr;
    bool is_open_ = false;
    bool finalized_ = false;
    int compression_level_ = 6;
    std::unordered_set<std::string> written_paths_;
    std::vector<uint8_t> buffer_;
    Stats stats_;

    void cleanup();
    void initializeFileInfo(void* file_info, const std::string& path, size_t size);
    ZipError writeFileEntry(const std::string& internal_path, const void* data, size_t size);
};

}} // namespace blobxl::archive
