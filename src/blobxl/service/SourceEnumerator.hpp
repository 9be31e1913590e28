#pragma once

#include "blobxl/core/CSVProcessor.hpp"
#include "blobxl/core/Table.hpp"
#include "blobxl/storage/IBlobStore.hpp"
#include <string>

namespace blobxl {
namespace service {

/**
 * @brief 列出并解析容器中前缀下的 CSV 对象
 *
 * 结果以对象基名（最后一个 '/' 之后的部分）为键，顺序为列表顺序。
 * 不同子目录下的同名对象，后者替换前者。
 */
class SourceEnumerator {
public:
    explicit SourceEnumerator(storage::IBlobStore& store,
                              std::string prefix = "csvfiles/",
                              std::string extension = ".csv");

    /**
     * @throws StorageException 列表或下载失败
     * @throws ParseException 任一对象不是合法 CSV
     */
    core::TableSet enumerate();

    // 上次 enumerate() 匹配到的对象数（含被同名替换的）
    size_t matchedObjects() const { return matched_; }

    static std::string baseName(const std::string& object_name);

private:
    storage::IBlobStore& store_;
    std::string prefix_;
    std::string extension_;
    core::CSVProcessor parser_;
    size_t matched_ = 0;
};

}} // namespace blobxl::service
