#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace blobxl {
namespace storage {

struct BlobItem {
    std::string name;
    uint64_t content_length = 0;
};

/**
 * @brief List Blobs 响应的一页
 */
struct BlobListPage {
    std::vector<BlobItem> blobs;
    std::string next_marker;   // 为空表示列表结束
};

/**
 * @brief 解析 List Blobs 响应体（EnumerationResults）
 */
class BlobListParser {
public:
    /**
     * @throws StorageException 响应不是合法的 EnumerationResults 文档
     */
    static BlobListPage parse(const std::string& xml);

    /**
     * @brief 解析错误响应 <Error><Code/><Message/></Error>
     * @return 成功解析返回 true
     */
    static bool parseError(const std::string& xml, std::string& code, std::string& message);
};

}} // namespace blobxl::storage
