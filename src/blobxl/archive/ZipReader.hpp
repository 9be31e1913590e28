#pragma once

#include "blobxl/archive/ZipError.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <string_view>
#include <map>

namespace blobxl {
namespace archive {

/**
 * @brief 从内存缓冲区读取 ZIP 归档
 *
 * 缓冲区由读取器持有一份拷贝，调用方可以在 open() 之后释放原数据。
 */
class ZipReader {
public:
    struct EntryInfo {
        std::string path;
        uint64_t compressed_size = 0;
        uint64_t uncompressed_size = 0;
        uint32_t crc32 = 0;
        int compression_method = 0;
        bool is_directory = false;
    };

    ZipReader();
    ~ZipReader();

    ZipReader(const ZipReader&) = delete;
    ZipReader& operator=(const ZipReader&) = delete;

    /**
     * 打开内存中的 ZIP 数据
     * @return 是否成功
     */
    bool open(const std::vector<uint8_t>& data);
    bool close();
    bool isOpen() const { return is_open_; }

    /**
     * 获取所有条目路径（按路径排序）
     */
    std::vector<std::string> listFiles() const;

    ZipError fileExists(std::string_view internal_path) const;
    bool getEntryInfo(std::string_view internal_path, EntryInfo& info) const;

    ZipError extractFile(std::string_view internal_path, std::string& content);
    ZipError extractFile(std::string_view internal_path, std::vector<uint8_t>& data);

private:
    void* unzip_handle_ = nullptr;
    std::vector<uint8_t> data_;
    bool is_open_ = false;
    std::map<std::string, EntryInfo> entry_cache_;

    void cleanup();
    void buildEntryCache();
};

}} // namespace blobxl::archive
